#include <csignal>
#include <cstdio>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include <etl/span.h>
#include <etl/string_view.h>

#include "config/features.hpp"
#include "logging/logging.hpp"
#include "version.hpp"
#include "front.hpp"
#include "app.hpp"

#include "gateway/gateway_frontend.hpp"
#ifdef USE_PUBLISH_STREAM
#include "publish/stream_publisher.hpp"
#endif
#ifdef USE_PUBLISH_UDP
#include "publish/udp_publisher.hpp"
#endif
#include "serial/serial_port.hpp"

namespace {

struct CliArgs {
    uint8_t verbosity = 0;
    const char* paramsPath = nullptr;
    std::vector<const char*> assignments;
    const char* publishAddr = nullptr;
    bool toStdout = false;
    bool dumpParams = false;
    bool saveParams = false;
    std::vector<const char*> devices;
};

std::atomic<bool> s_stop{false};

void HandleSignal(int)
{
    s_stop.store(true);
}

void PrintUsage(const char* prog)
{
    fprintf(stderr,
            "magicloc %s\n"
            "Usage: %s [-v]... [-c params.txt] [-p group.name=value]... [-a host:port] [-o] -s <dev> [<dev>...]\n"
            "       %s [-c params.txt] [-p group.name=value]... --dump-params | --save-params\n"
            "  -s, --serial-ports <dev>...   Anchor serial devices, slot order\n"
            "  -c, --config <file>           Parameter file (default params.txt)\n"
            "  -p, --param <group.name=val>  Override one parameter\n"
            "  -a, --publish-addr <host:port> UDP publish target\n"
            "  -o, --stdout                  Publish to stdout instead of UDP\n"
            "  --dump-params                 Print the effective parameters and exit\n"
            "  --save-params                 Write the effective parameters to the parameter file and exit\n"
            "  -v                            Raise verbosity, repeatable\n"
            "  -h, --help                    Show this help\n",
            MAGICLOC_VERSION, prog, prog);
}

bool IsOption(const char* arg, const char* shortName, const char* longName)
{
    return strcmp(arg, shortName) == 0 || (longName != nullptr && strcmp(arg, longName) == 0);
}

// Returns false on usage errors, exit code is set for -h
bool ParseArgs(int argc, char** argv, CliArgs& args, int& exitCode)
{
    for (int i = 1; i < argc; ++i) {
        const char* cur = argv[i];
        const bool hasValue = i + 1 < argc;

        if (strcmp(cur, "-v") == 0 || strcmp(cur, "-vv") == 0 || strcmp(cur, "-vvv") == 0) {
            args.verbosity += static_cast<uint8_t>(strlen(cur) - 1);
        } else if (IsOption(cur, "-c", "--config") && hasValue) {
            args.paramsPath = argv[++i];
        } else if (IsOption(cur, "-p", "--param") && hasValue) {
            args.assignments.push_back(argv[++i]);
        } else if (IsOption(cur, "-a", "--publish-addr") && hasValue) {
            args.publishAddr = argv[++i];
        } else if (IsOption(cur, "-o", "--stdout")) {
            args.toStdout = true;
        } else if (strcmp(cur, "--dump-params") == 0) {
            args.dumpParams = true;
        } else if (strcmp(cur, "--save-params") == 0) {
            args.saveParams = true;
        } else if (IsOption(cur, "-s", "--serial-ports")) {
            // Every following non-option argument is a device
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                args.devices.push_back(argv[++i]);
            }
        } else if (IsOption(cur, "-h", "--help")) {
            PrintUsage(argv[0]);
            exitCode = App::kExitOk;
            return false;
        } else {
            fprintf(stderr, "Unrecognized or incomplete option: %s\n", cur);
            PrintUsage(argv[0]);
            exitCode = App::kExitFailure;
            return false;
        }
    }

    if (args.dumpParams || args.saveParams) {
        return true;
    }
    if (args.devices.empty()) {
        fprintf(stderr, "At least one serial port is required (-s)\n");
        PrintUsage(argv[0]);
        exitCode = App::kExitFailure;
        return false;
    }
    if (args.devices.size() > stream_sync::kMaxStreams) {
        fprintf(stderr, "At most %u serial ports are supported\n", static_cast<unsigned>(stream_sync::kMaxStreams));
        exitCode = App::kExitFailure;
        return false;
    }
    return true;
}

// "host:port" into its parts, host is copied into the caller's buffer
bool SplitHostPort(const char* addr, HostName& host, uint16_t& port)
{
    const char* colon = strrchr(addr, ':');
    if (colon == nullptr || colon == addr) {
        return false;
    }

    const size_t hostLen = static_cast<size_t>(colon - addr);
    if (hostLen >= host.size()) {
        return false;
    }

    if (Utils::TransformStrToData(ParamType::UINT16, colon + 1, &port) != Utils::ErrorTransform::OK) {
        return false;
    }

    host.fill('\0');
    memcpy(host.data(), addr, hostLen);
    return true;
}

void SetupLogging(const GatewayParams& params)
{
    const char* logHost = params.logUdpHost.data();
    if (logHost[0] == '\0') {
        magicloc::log::Logger::disableUdp();
        return;
    }

    const uint16_t logPort = params.logUdpPort;
    if (!magicloc::log::Logger::setUdpTarget(logHost, logPort)) {
        LOG_WARN("UDP logging to %s:%u unavailable, stderr only", logHost, static_cast<unsigned>(logPort));
        return;
    }
    LOG_INFO("Logging to udp://%s:%u", logHost, static_cast<unsigned>(logPort));
}
}

int main(int argc, char** argv)
{
    CliArgs args;
    int exitCode = App::kExitOk;
    if (!ParseArgs(argc, argv, args, exitCode)) {
        return exitCode;
    }

    magicloc::log::Logger::init();
    magicloc::log::Logger::setLevel(magicloc::log::logLevelFromVerbosity(args.verbosity));
    LOG_INFO("magicloc %s (%s %s)", MAGICLOC_VERSION, BUILD_DATE, BUILD_TIME);

    if (args.paramsPath != nullptr) {
        Front::SetParamsPath(args.paramsPath);
    }
    Front::InitFrontends();

    for (const char* assignment : args.assignments) {
        ErrorParam err = Front::ApplyAssignment(etl::string_view(assignment));
        if (err != ErrorParam::OK) {
            LOG_ERROR("Invalid parameter override '%s': %s", assignment, ToString(err));
            return App::kExitFailure;
        }
    }

    if (args.saveParams) {
        ErrorParam err = Front::SaveAllParams();
        if (err != ErrorParam::OK) {
            LOG_ERROR("Saving %s failed: %s", Front::GetParamsPath(), ToString(err));
            return App::kExitFailure;
        }
    }
    if (args.dumpParams) {
        return Front::PrintAllParams(stdout) == ErrorParam::OK ? App::kExitOk : App::kExitFailure;
    }
    if (args.saveParams) {
        return App::kExitOk;
    }

    GatewayParams params = Front::gatewayFront.GetParams();

    if (args.publishAddr != nullptr) {
        HostName host = {};
        uint16_t port = 0;
        if (!SplitHostPort(args.publishAddr, host, port)) {
            LOG_ERROR("Invalid publish address '%s', expected host:port", args.publishAddr);
            return App::kExitFailure;
        }
        params.publishHost = host;
        params.publishPort = port;
    }

    SetupLogging(params);

    std::unique_ptr<publish::IPublisher> publisher;
    std::vector<std::unique_ptr<serial::SerialPort>> ports;

    try {
#ifdef USE_PUBLISH_STREAM
        if (args.toStdout) {
            publisher = std::make_unique<publish::StreamPublisher>(stdout);
            LOG_INFO("Publishing to stdout");
        }
#endif
#ifdef USE_PUBLISH_UDP
        if (!publisher) {
            uint16_t publishPort = params.publishPort;
            publisher = std::make_unique<publish::UdpPublisher>(params.publishHost.data(), publishPort);
        }
#endif
        if (!publisher) {
            throw std::runtime_error("requested publish sink is not compiled in");
        }

        const uint32_t baudRate = params.baudRate;
        const bool lowLatency = params.lowLatency;
        for (const char* device : args.devices) {
            ports.push_back(std::make_unique<serial::SerialPort>(device, baudRate, lowLatency));
            LOG_INFO("Anchor slot %u: %s", static_cast<unsigned>(ports.size()), device);
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Startup failed: %s", e.what());
        return App::kExitFailure;
    }

    std::vector<serial::ISerialSource*> sources;
    for (const auto& port : ports) {
        sources.push_back(port.get());
    }

    struct sigaction action = {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_WARN("Failed to install signal handlers: %s", strerror(errno));
    }

    App app(params, sources.size(), *publisher);
    return app.Run(etl::span<serial::ISerialSource* const>(sources.data(), sources.size()), s_stop);
}
