#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <fzd/config_io.hpp>
#include <fzd/controller.hpp>
#include <fzd/errors.hpp>
#include <fzd/sim_runner.hpp>
#include <fzd/viewer/app.hpp>
#include <spdlog/spdlog.h>

using namespace fzd;

// usage: fuzzydrive_viewer [-v] [config.csv]
int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-v") == 0) spdlog::set_level(spdlog::level::debug);
    else config_path = argv[i];
  }

  try {
    LoadedConfig cfg;
    if (!config_path.empty()) {
      auto loaded = load_config_file(config_path);
      if (!loaded) {
        spdlog::error("cannot open config '{}'", config_path);
        return 1;
      }
      cfg = std::move(*loaded);
    }

    auto controller = std::make_shared<const FuzzyController>(cfg.controller);
    SimRunner sim(controller, cfg.vehicle, cfg.sim);
    sim.start();

    ViewerApp app(sim);
    const int code = app.run();

    sim.stop();
    return code;
  } catch (const InvalidParameter& e) {
    spdlog::error("invalid configuration: {}", e.what());
    return 2;
  }
}
