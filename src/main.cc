#include <cstdlib>

#include "app.hh"
#include "curve25519.hh"
#include "entropy.hh"
#include "epoll.hh"
#include "log.hh"
#include "terminal.hh"

using namespace dhprobe;

int main(int argc, char *argv[]) {
  app::Config config;
  if (argc > 1) {
    config.log_path = argv[1];
  }

  Status status;
  LogToFile(config.log_path.c_str(), status);
  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }
  LOG << "ECDH Test App starting...";

  entropy::DevUrandom entropy;
  entropy.Open(config.entropy, status);
  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }
  curve25519::Donna curve;

  // Signals must be blocked before ncurses starts.
  terminal::Signals signals;
  signals.Open(status);
  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }

  terminal::Terminal term;
  term.Open(status);
  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }
  signals.terminal = &term;

  app::App app(entropy, curve, config.layout);
  app.Start(term, status);
  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }

  epoll::Init();
  auto on_event = [&](const app::Event &event) {
    app.Handle(event, term);
    if (!app.running) {
      epoll::Del(&term, status);
      epoll::Del(&signals, status);
    }
  };
  term.on_event = on_event;
  signals.on_event = on_event;
  epoll::Add(&term, status);
  epoll::Add(&signals, status);
  if (status.Ok()) {
    epoll::Loop(status);
  }
  term.Close();

  if (!status.Ok()) {
    ERROR << status;
    return EXIT_FAILURE;
  }
  LOG << "ECDH Test App exiting";
  return EXIT_SUCCESS;
}
