#include "client.hpp"
#include "modules/battery.hpp"

int main(int argc, char *argv[]) {
  using dockapp::modules::Battery;
  return dockapp::run(argc, argv,
                      {.name = Battery::NAME,
                       .config_name = "battery",
                       .cli = &Battery::cli,
                       .create = &Battery::create,
                       .args_key = "formats"});
}
