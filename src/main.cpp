#include "core/credential_store.hpp"
#include "core/cross_post_coordinator.hpp"
#include "core/cross_post_settings.hpp"
#include "core/media_probe.hpp"
#include "core/media_transcoder.hpp"
#include "core/poco_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "core/size_aware_optimizer.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include "net/http_transport.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_MISSING_CREDENTIALS = 2;

    void printUsage(const char *program)
    {
        std::cout << "crosspost - post text and media to Twitter and Bluesky at once" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --set KEY=VALUE     Store a credential (apiKey, apiSecret, accessToken," << std::endl;
        std::cout << "                      accessSecret, blueskyHandle, blueskyPassword); repeatable" << std::endl;
        std::cout << "  --text TEXT         Text of the post" << std::endl;
        std::cout << "  --media PATH        Image or video to attach" << std::endl;
        std::cout << "  --mime TYPE         Mime type of the attachment" << std::endl;
        std::cout << "  --no-bluesky        Post to Twitter only" << std::endl;
        std::cout << "  --config PATH       Configuration file (default: config.json)" << std::endl;
        std::cout << "  --log-level LEVEL   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h          Show this help message" << std::endl;
    }

    int exitCodeFor(PostResultKind kind)
    {
        switch (kind)
        {
        case PostResultKind::SUCCESS:
        case PostResultKind::PARTIAL_SUCCESS:
            return EXIT_OK;
        case PostResultKind::MISSING_CREDENTIALS:
            return EXIT_MISSING_CREDENTIALS;
        default:
            return EXIT_FAILED;
        }
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    std::optional<std::string> log_level;
    std::vector<std::pair<std::string, std::string>> settings;
    std::optional<std::string> text;
    std::optional<std::string> media_path;
    std::optional<std::string> mime_type;
    bool bluesky = true;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto nextValue = [&](const std::string &flag) -> std::optional<std::string>
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (arg == "--no-bluesky")
        {
            bluesky = false;
        }
        else if (arg == "--config" || arg == "--log-level" || arg == "--set" || arg == "--text" ||
                 arg == "--media" || arg == "--mime")
        {
            auto value = nextValue(arg);
            if (!value)
                return EXIT_FAILED;

            if (arg == "--config")
                config_path = *value;
            else if (arg == "--log-level")
                log_level = *value;
            else if (arg == "--text")
                text = *value;
            else if (arg == "--media")
                media_path = *value;
            else if (arg == "--mime")
                mime_type = *value;
            else
            {
                size_t eq = value->find('=');
                if (eq == std::string::npos || eq == 0)
                {
                    std::cerr << "--set expects KEY=VALUE, got: " << *value << std::endl;
                    return EXIT_FAILED;
                }
                settings.emplace_back(value->substr(0, eq), value->substr(eq + 1));
            }
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_FAILED;
        }
    }

    auto &config = PocoConfigManager::getInstance();
    config.load(config_path);
    Logger::init(log_level.value_or(config.getLogLevel()), config.getLogFile());

    if (!config.validateConfig())
    {
        Logger::error("Invalid configuration in " + config_path);
        return EXIT_FAILED;
    }

    std::shared_ptr<SqliteCredentialStore> store;
    try
    {
        store = std::make_shared<SqliteCredentialStore>(config.getCredentialsDbPath());
    }
    catch (const std::exception &e)
    {
        Logger::error(e.what());
        return EXIT_FAILED;
    }

    // Settings flow
    if (!settings.empty())
    {
        for (const auto &entry : settings)
        {
            if (!Credentials::isKnownKey(entry.first))
            {
                Logger::error("Unknown credential key: " + entry.first);
                return EXIT_FAILED;
            }
        }
        try
        {
            store->set(settings);
        }
        catch (const std::exception &e)
        {
            Logger::error(e.what());
            return EXIT_FAILED;
        }
        std::cout << "Saved " << settings.size() << " credential(s)." << std::endl;
        if (!text && !media_path)
        {
            return EXIT_OK;
        }
    }

    if (!text && !media_path)
    {
        printUsage(argv[0]);
        return EXIT_FAILED;
    }

    CrossPostSettings post_settings = CrossPostSettings::fromConfig(config);

    HttplibTransport::Timeouts timeouts;
    timeouts.connect = std::chrono::milliseconds(config.getHttpConnectTimeoutMs());
    timeouts.read = std::chrono::milliseconds(config.getHttpReadTimeoutMs());
    timeouts.write = timeouts.read;
    auto transport = std::make_shared<HttplibTransport>(timeouts);

    auto images = std::make_shared<OpenCvImageTranscoder>();
    auto videos = std::make_shared<FfmpegVideoTranscoder>();
    auto optimizer = std::make_shared<SizeAwareOptimizer>(images, videos, post_settings.optimizer);
    MediaProbe probe(images, videos);

    int exit_code = EXIT_FAILED;
    {
        CrossPostCoordinator coordinator(transport, store, optimizer, post_settings);

        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();
        uint64_t shutdown_id = shutdown.addShutdownCallback([&coordinator]()
                                                            { coordinator.cancelAll(); });

        coordinator.setProgressListener([](Destination destination, double fraction)
                                        { std::cout << "\r" << toString(destination) << " upload: " << std::fixed
                                                    << std::setprecision(0) << fraction * 100.0 << "%" << std::flush; });

        coordinator.setText(text.value_or(""));
        if (!bluesky)
        {
            // Before media selection so no eager Bluesky upload starts
            coordinator.setBlueskyEnabled(false);
        }

        if (media_path)
        {
            try
            {
                coordinator.selectMedia(probe.probe(*media_path, mime_type));
            }
            catch (const ValidationError &e)
            {
                Logger::error(e.what());
                shutdown.removeShutdownCallback(shutdown_id);
                return EXIT_FAILED;
            }
        }

        ComposerSnapshot view = coordinator.snapshot();
        if (!view.bluesky_eligibility.eligible)
        {
            std::cout << "Bluesky disabled: " << view.bluesky_eligibility.reason << std::endl;
        }

        PostResult result = coordinator.requestPost().get();
        std::cout << std::endl
                  << result.title << ": " << result.message << std::endl;
        if (result.outcome)
        {
            if (!result.outcome->twitter.post_id.empty())
                std::cout << "  tweet id: " << result.outcome->twitter.post_id << std::endl;
            if (!result.outcome->bluesky.post_id.empty())
                std::cout << "  bluesky uri: " << result.outcome->bluesky.post_id << std::endl;
        }
        if (result.kind == PostResultKind::MISSING_CREDENTIALS)
        {
            std::cout << "Store them with: " << argv[0] << " --set apiKey=... --set apiSecret=... "
                      << "--set accessToken=... --set accessSecret=..." << std::endl;
        }

        exit_code = exitCodeFor(result.kind);
        shutdown.removeShutdownCallback(shutdown_id);
    }
    return exit_code;
}
