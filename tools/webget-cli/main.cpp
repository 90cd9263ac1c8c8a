#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <webget/cli/download_command.h>

#ifndef WEBGET_VERSION
#define WEBGET_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
    try {
        // Logs share stderr with progress; stdout is reserved for results
        auto logger = spdlog::stderr_color_mt("webget");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"webget - resolve and download HTTP(S) resources to local files", "webget"};
        app.set_version_flag("--version", WEBGET_VERSION);

        webget::cli::DownloadOptions opts;
        webget::cli::registerDownloadOptions(app, opts);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            const int rc = app.exit(e);
            return rc == 0 ? 0 : 2;
        }

        spdlog::set_level(webget::cli::logLevelFor(opts));
        return webget::cli::runDownload(opts);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
