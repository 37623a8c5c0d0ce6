#include "client.hpp"
#include "modules/cpu.hpp"

int main(int argc, char *argv[]) {
  using dockapp::modules::Cpu;
  return dockapp::run(argc, argv,
                      {.name = Cpu::NAME,
                       .config_name = "cpu",
                       .cli = &Cpu::cli,
                       .create = &Cpu::create});
}
