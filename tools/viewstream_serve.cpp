#include <csignal>
#include <cstdlib>

#include <viewstream/serve/StreamingServer.hpp>

namespace {
void handle_signal(int) {
    VS::Serve::RequestServeStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = VS::Serve::ParseServeArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        VS::Serve::PrintServeUsage();
        return EXIT_SUCCESS;
    }

    VS::Serve::ResetServeStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return VS::Serve::RunStreamingServer(options);
}
