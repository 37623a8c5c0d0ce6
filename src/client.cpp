#include "client.hpp"

#include <fcntl.h>
#include <giomm/init.h>
#include <glibmm/exception.h>
#include <glibmm/init.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <stdexcept>

#ifdef HAVE_LIBSYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#include <sys/stat.h>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <system_error>
#endif


#include <X11/Xlib.h>

#ifndef VERSION
#define VERSION "unknown"
#endif

namespace {

int signal_pipe_read_fd = -1;
int signal_pipe_write_fd = -1;

// Write a single signal to `signal_pipe_write_fd`.
// This function is set as a signal handler, so it must be async-signal-safe.
void writeSignalToPipe(int signum) {
  ssize_t amt = write(signal_pipe_write_fd, &signum, sizeof(int));

  // There's not much we can safely do inside of a signal handler.
  // Let's just ignore any errors.
  (void)amt;
}

// Routes SIGINT and SIGTERM into a pipe read by the main loop.
void catchSignals() {
  int fd[2];
  if (pipe(fd) != 0) {
    throw std::runtime_error(std::string("can't create signal pipe: ") + strerror(errno));
  }
  signal_pipe_read_fd = fd[0];
  signal_pipe_write_fd = fd[1];

  // We can't allow the write end to block because we'll be writing to it in a
  // signal handler, which could interrupt the loop that's reading from it and
  // deadlock.
  fcntl(signal_pipe_write_fd, F_SETFL, O_NONBLOCK);

  std::signal(SIGINT, writeSignalToPipe);
  std::signal(SIGTERM, writeSignalToPipe);
}

void logToJournalIfRunAsService() {
#ifdef HAVE_LIBSYSTEMD
  /* Implementation of automatic protocol upgrading (from stderr to journal)
  ** as described in https://systemd.io/JOURNAL_NATIVE_PROTOCOL */
  char const *journal_stream = std::getenv("JOURNAL_STREAM");

  if (journal_stream != nullptr) {
    dev_t device;
    ino_t inode;
    size_t len = std::strlen(journal_stream);

    auto result = std::from_chars(journal_stream, journal_stream + len, device);
    if (result.ec == std::errc{})
      result = std::from_chars(result.ptr + 1, journal_stream + len, inode);
    if (result.ec != std::errc{}) {
      spdlog::warn("malformed JOURNAL_STREAM (\"{}\"): {}, logging to console", journal_stream,
                   std::make_error_condition(result.ec).message());
      return;
    }

    struct stat f_stderr;

    if (fstat(STDERR_FILENO, &f_stderr) != 0) {
      spdlog::warn("unable to check stderr device and inode numbers: {}", strerror(errno));
    } else if (device == f_stderr.st_dev && inode == f_stderr.st_ino) {
      auto journald = spdlog::systemd_logger_st("native_journal", "dockapp", false);
      /* systemd_logger_st is thread-safe with enable_formatter = false
      ** thanks to underlying sd_journal_send being thread-safe
      ** https://github.com/gabime/spdlog/issues/2320#issuecomment-1079766037
      */
      spdlog::set_default_logger(journald);
    } else {
      spdlog::info("JOURNAL_STREAM does not point to stderr, logging to console");
    }
  } else {
    spdlog::debug("no JOURNAL_STREAM, logging to console");
  }
#endif
}

struct DisplayDeleter {
  void operator()(Display *display) const { XCloseDisplay(display); }
};

}  // namespace

dockapp::Client *dockapp::Client::inst() {
  static auto *c = new Client();
  return c;
}

bool dockapp::Client::handleSignal(Glib::IOCondition /*condition*/) {
  int signum;
  ssize_t amt = read(signal_pipe_read_fd, &signum, sizeof(int));
  if (amt < 0) {
    spdlog::error("read from signal pipe failed with error {}, no longer handling signals",
                  strerror(errno));
    return false;
  }
  if (amt != sizeof(int)) {
    return true;
  }
  switch (signum) {
    case SIGINT:
    case SIGTERM:
      spdlog::info("Quitting.");
      reset();
      break;
    default:
      spdlog::debug("Received signal with number {}, but not handling", signum);
      break;
  }
  return true;
}

bool dockapp::Client::handleXEvents(Glib::IOCondition condition) {
  if ((condition & (Glib::IO_HUP | Glib::IO_ERR)) != 0) {
    spdlog::error("lost the connection to the X server");
    reset();
    return false;
  }
  if (!app_->window().dispatchEvents()) {
    reset();
    return false;
  }
  return true;
}

int dockapp::Client::main(int argc, char *argv[], const AppInfo &info) {
  bool show_help = false;
  bool show_version = false;
  std::string config_opt;
  std::string log_level;
  CommandLine cmdline;
  auto cli = clara::detail::Help(show_help) |
             clara::detail::Opt(show_version)["-v"]["--version"]("Show version") |
             clara::detail::Opt(config_opt, "config")["-c"]["--config"]("Config path") |
             clara::detail::Opt(
                 log_level,
                 "trace|debug|info|warning|error|critical|off")["-l"]["--log-level"]("Log level") |
             info.cli(cmdline);
  auto res = cli.parse(clara::detail::Args(argc, argv));
  if (!res) {
    spdlog::error("Error in command line: {}", res.errorMessage());
    return 1;
  }
  if (show_help) {
    std::cout << cli << '\n';
    return 0;
  }
  if (show_version) {
    std::cout << info.name << " v" << VERSION << '\n';
    return 0;
  }
  if (!log_level.empty()) {
    spdlog::set_level(spdlog::level::from_str(log_level));
  }

  config.load(config_opt, info.config_name);
  if (!info.args_key.empty() && !cmdline.args.empty()) {
    Json::Value args(Json::arrayValue);
    for (const auto &arg : cmdline.args) {
      args.append(arg);
    }
    cmdline.overrides[info.args_key] = args;
  }
  config.applyOverrides(cmdline.overrides);

  Glib::init();
  Gio::init();

  std::unique_ptr<Display, DisplayDeleter> display(XOpenDisplay(nullptr));
  if (!display) {
    throw std::runtime_error(std::string("Can't open display ") + XDisplayName(nullptr));
  }

  main_loop_ = Glib::MainLoop::create();
  app_ = info.create(display.get(), config.getConfig());

  catchSignals();
  auto signal_watch = Glib::signal_io().connect(sigc::mem_fun(*this, &Client::handleSignal),
                                                signal_pipe_read_fd, Glib::IO_IN);
  auto x_watch = Glib::signal_io().connect(sigc::mem_fun(*this, &Client::handleXEvents),
                                           app_->window().connectionNumber(),
                                           Glib::IO_IN | Glib::IO_HUP | Glib::IO_ERR);
  sleep_watcher_ = std::make_unique<util::SleepWatcher>();
  auto resume = sleep_watcher_->onResume([this] {
    spdlog::info("Resumed from sleep, refreshing");
    app_->refresh();
  });

  app_->start();
  app_->window().map();
  if (app_->window().dispatchEvents()) {
    main_loop_->run();
  }

  std::signal(SIGINT, SIG_IGN);
  std::signal(SIGTERM, SIG_IGN);
  resume.disconnect();
  x_watch.disconnect();
  signal_watch.disconnect();
  sleep_watcher_.reset();
  app_->stop();
  app_.reset();
  return 0;
}

void dockapp::Client::reset() {
  if (main_loop_) {
    main_loop_->quit();
  }
}

int dockapp::run(int argc, char *argv[], const AppInfo &info) {
  logToJournalIfRunAsService();

  try {
    return Client::inst()->main(argc, argv, info);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const Glib::Exception &e) {
    spdlog::error("{}", static_cast<std::string>(e.what()));
    return 1;
  }
}
