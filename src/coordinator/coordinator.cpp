#include <powpool/coordinator/coordinator.hpp>

#include <string>

#include <powpool/coordinator/command_router.hpp>

namespace powpool::coordinator {

Coordinator::Coordinator(powpool::config::CoordinatorConfig cfg, std::unique_ptr<WorkApi> api,
                         powpool::logging::Logger& log)
    : cfg_(std::move(cfg)),
      api_(std::move(api)),
      log_(log),
      registry_(log),
      distributor_(registry_, *api_, board_, log),
      results_(registry_, *api_, board_, log),
      listener_(ioc_, cfg_.password, registry_, results_, log) {}

Coordinator::~Coordinator() { stop(); }

void Coordinator::start() { listener_.start(cfg_.port); }

void Coordinator::stop() {
    registry_.close_all();
    listener_.stop();
}

int Coordinator::run_console(std::istream& in, std::ostream& out) {
    CommandRouter router(registry_, distributor_, results_, out, log_, [this] { listener_.stop(); });

    std::string line;
    while (true) {
        out << "$ " << std::flush;
        if (!std::getline(in, line)) {
            log_.info("End of console input");
            router.dispatch("quit");
            break;
        }
        if (!router.dispatch(line)) break;
    }
    return 0;
}

} // namespace powpool::coordinator
