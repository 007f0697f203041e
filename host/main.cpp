#include "vrb/vrb.h"
#include "vrb/vrb_bridge.hpp"

#include "common/sync.hpp"

#include <stdlib.h>
#include <csignal>
#include <iostream>
#include <sstream>
#include <optional>
#include <string>
#include <string_view>
#include <stdexcept>
#include <thread>

#ifdef _WIN32
# include <windows.h>
#else
# include <signal.h>
# include <stdio.h>
#endif

VrbLogLevel g_loglevel = kVrbLogLevelWarning;

vrb::sync::mutex g_print_mutex;

// NB: stdout is reserved for command replies and events
void VRB_CALL log_function(VrbLogLevel level, const VrbChar *msg) {
    if (level <= g_loglevel) {
        vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_print_mutex);
        switch (level) {
        case kVrbLogLevelDebug:
            std::cerr << "[debug] ";
            break;
        case kVrbLogLevelVerbose:
            std::cerr << "[verbose] ";
            break;
        case kVrbLogLevelWarning:
            std::cerr << "[warning] ";
            break;
        case kVrbLogLevelError:
            std::cerr << "[error] ";
            break;
        default:
            break;
        }
        std::cerr << msg << std::endl;
    }
}

void VRB_CALL handle_event(void *, const VrbEvent *event, VrbThreadLevel) {
    vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_print_mutex);
    std::cout << vrb_eventName(event->type);
    switch (event->type) {
    case kVrbEventError:
        std::cout << " " << event->error.errorMessage;
        break;
    case kVrbEventVrchatMute:
        std::cout << " " << (event->vrchatMute.muted ? "true" : "false");
        break;
    case kVrbEventRealtimeMessage:
    {
        auto& e = event->realtimeMessage;
        std::cout << " " << std::string_view(e.text, e.size);
        break;
    }
    case kVrbEventRealtimeError:
        std::cout << " " << event->realtimeError.errorMessage;
        break;
    default:
        break;
    }
    std::cout << std::endl;
}

VrbBridge::Ptr g_bridge;

// NB: written by the signal handler
volatile sig_atomic_t g_error_code = 0;
vrb::sync::semaphore g_semaphore;

// guards g_bridge against the input thread
vrb::sync::mutex g_command_mutex;
bool g_quit = false;

void stop_host(int error) {
    g_error_code = error;
    g_semaphore.post();
}

#ifdef _WIN32
BOOL WINAPI console_handler(DWORD signal) {
    switch (signal) {
    case CTRL_C_EVENT:
        stop_host(0);
        return TRUE;
    case CTRL_CLOSE_EVENT:
        return TRUE;
    // Pass other signals to the next handler.
    default:
        return FALSE;
    }
}
#else
bool set_signal_handler(int sig, sig_t handler) {
    struct sigaction sa;
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(sig, &sa, nullptr) == 0) {
        return true;
    } else {
        perror("sigaction");
        return false;
    }
}

bool set_signal_handlers() {
    // NB: stop_host() is async-signal-safe, see sync::semaphore::post()
    auto handler = [](int) { stop_host(0); };
    return set_signal_handler(SIGINT, handler)
           && set_signal_handler(SIGTERM, handler);
}
#endif

void print_usage() {
    std::cout
        << "Usage: vrb_host [OPTIONS]...\n"
        << "Run the VRB bridge; commands are read from stdin\n"
        << "Options:\n"
        << "  -h, --help             display help and exit\n"
        << "  -v, --version          print version and exit\n"
        << "  -p, --listen-port=PORT OSC listener port (default = " << VRB_OSC_LISTEN_PORT << ")\n"
        << "  -u, --url=TEMPLATE     realtime URL template; '%s' is the model\n"
        << "  -l, --log-level=LEVEL  set log level (0-4)\n"
        << "      --poll             poll events on the main thread\n"
        << "Commands:\n"
        << "  typing <address> <port>\n"
        << "  message <address> <port> <text...>\n"
        << "  listen\n"
        << "  audio-settings\n"
        << "  connect <api-key> <model>\n"
        << "  send <text...>\n"
        << "  close\n"
        << "  quit\n"
        << std::endl;
}

template<typename T>
T parse_argument(std::string_view option, std::string_view arg) {
    T result;
    std::istringstream ss{std::string(arg)};
    if (!(ss >> result)) {
        throw std::runtime_error("Bad argument '" + std::string(arg)
                                 + "' for option '" + std::string(option) + "'");
    }
    return result;
}

// match option with a single argument, either "-f <arg>",
// "--foo <arg>" or "--foo=<arg>"
template<typename T>
std::optional<T> match_option(const char **& argv, int& argc,
                              const char* short_option, const char* long_option) {
    std::string_view opt(argv[0]);
    if ((short_option && opt == short_option) || (long_option && opt == long_option)) {
        if (argc < 2) {
            throw std::runtime_error("Missing argument for option '"
                                     + std::string(opt) + "'");
        }
        auto result = parse_argument<T>(opt, argv[1]);
        argv += 2; argc -= 2;
        return result;
    }
    auto eq = opt.find('=');
    if (long_option && eq != std::string_view::npos && opt.substr(0, eq) == long_option) {
        auto result = parse_argument<T>(opt.substr(0, eq), opt.substr(eq + 1));
        argv++; argc--;
        return result;
    }
    return std::nullopt;
}

// match option without argument
bool match_option(const char **& argv, int& argc,
                  const char* short_option, const char* long_option) {
    std::string_view opt(argv[0]);
    if ((short_option && opt == short_option) || (long_option && opt == long_option)) {
        argv++; argc--;
        return true;
    }
    return false;
}

//--------------------- commands ----------------------//

// the rest of the line without leading whitespace
std::string remainder(std::istream& is) {
    std::string result;
    std::getline(is >> std::ws, result);
    return result;
}

void reply(VrbError err, const VrbErrorInfo& info) {
    vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_print_mutex);
    if (err == kVrbOk) {
        std::cout << "ok" << std::endl;
    } else if (info.message[0] != '\0') {
        std::cout << "error: " << info.message << std::endl;
    } else {
        std::cout << "error: " << vrb_strerror(err) << std::endl;
    }
}

void reply_error(const std::string& msg) {
    vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_print_mutex);
    std::cout << "error: " << msg << std::endl;
}

// returns false on "quit"
bool handle_command(const std::string& line) {
    std::istringstream is(line);
    std::string cmd;
    if (!(is >> cmd)) {
        return true; // empty line
    }

    VrbErrorInfo info = {};
    VrbError err = kVrbOk;

    if (cmd == "quit") {
        return false;
    } else if (cmd == "typing") {
        std::string address;
        int port;
        if (!(is >> address >> port)) {
            reply_error("usage: typing <address> <port>");
            return true;
        }
        err = g_bridge->sendTyping(address.c_str(), port, &info);
    } else if (cmd == "message") {
        std::string address;
        int port;
        if (!(is >> address >> port)) {
            reply_error("usage: message <address> <port> <text...>");
            return true;
        }
        auto text = remainder(is);
        err = g_bridge->sendMessage(text.c_str(), address.c_str(), port, &info);
    } else if (cmd == "listen") {
        err = g_bridge->startOscListener();
    } else if (cmd == "audio-settings") {
        err = g_bridge->showAudioSettings();
    } else if (cmd == "connect") {
        std::string key, model;
        if (!(is >> key >> model)) {
            reply_error("usage: connect <api-key> <model>");
            return true;
        }
        err = g_bridge->realtimeConnect(key.c_str(), model.c_str(), &info);
    } else if (cmd == "send") {
        auto text = remainder(is);
        err = g_bridge->realtimeSend(text.c_str(), &info);
    } else if (cmd == "close") {
        err = g_bridge->realtimeClose(&info);
    } else {
        reply_error("unknown command '" + cmd + "'");
        return true;
    }

    reply(err, info);
    return true;
}

int main(int argc, const char **argv) {
    // set control handler
#ifdef _WIN32
    if (!SetConsoleCtrlHandler(console_handler, TRUE)) {
        std::cout << "Could not set console handler" << std::endl;
        return EXIT_FAILURE;
    }
#else
    if (!set_signal_handlers()) {
        return EXIT_FAILURE;
    }
#endif

    // parse command line options
    int port = VRB_OSC_LISTEN_PORT;
    std::string url = VRB_REALTIME_URL;
    bool poll = false;

    argc--; argv++;

    try {
        while ((argc > 0) && (argv[0][0] == '-')) {
            if (match_option(argv, argc, "-h", "--help")) {
                print_usage();
                return EXIT_SUCCESS;
            } else if (match_option(argv, argc, "-v", "--version")) {
                std::cout << "vrb_host " << vrb_getVersionString() << std::endl;
                return EXIT_SUCCESS;
            } else if (auto arg = match_option<int>(argv, argc, "-p", "--listen-port")) {
                port = *arg;
                if (port <= 0 || port > 65535) {
                    std::cout << "Port number " << port << " out of range" << std::endl;
                    return EXIT_FAILURE;
                }
            } else if (auto arg = match_option<std::string>(argv, argc, "-u", "--url")) {
                url = *arg;
            } else if (match_option(argv, argc, nullptr, "--poll")) {
                poll = true;
            } else if (auto arg = match_option<int>(argv, argc, "-l", "--log-level")) {
                auto level = *arg;
                if (level < kVrbLogLevelNone || level > kVrbLogLevelDebug) {
                    std::cout << "Log level " << level << " out of range" << std::endl;
                    return EXIT_FAILURE;
                }
                g_loglevel = level;
            } else {
                std::cout << "Unknown command line option '" << argv[0] << "'" << std::endl;
                print_usage();
                return EXIT_FAILURE;
            }
        }
        if (argc > 0) {
            std::cout << "Ignoring excess arguments: ";
            for (int i = 0; i < argc; ++i) {
                std::cout << argv[i] << " ";
            }
            std::cout << std::endl;
        }
    } catch (const std::exception& e) {
        std::cout << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    VrbSettings settings = VRB_SETTINGS_INIT();
    settings.logFunc = log_function;
    if (auto err = vrb_initialize(&settings); err != kVrbOk) {
        std::cout << "Could not initialize VRB library: "
                  << vrb_strerror(err) << std::endl;
        return EXIT_FAILURE;
    }

    g_bridge = VrbBridge::create();
    if (!g_bridge) {
        std::cout << "Could not create VrbBridge" << std::endl;
        return EXIT_FAILURE;
    }

    g_bridge->setEventHandler(handle_event, nullptr,
                              poll ? kVrbEventModePoll : kVrbEventModeCallback);

    VrbBridgeSettings bridge_settings = VRB_BRIDGE_SETTINGS_INIT();
    bridge_settings.listenPort = port;
    bridge_settings.realtimeUrl = url.c_str();

    if (auto err = g_bridge->setup(bridge_settings); err != kVrbOk) {
        std::cout << "Could not setup VrbBridge: " << vrb_strerror(err) << std::endl;
        return EXIT_FAILURE;
    }

    // NB: a blocking read from stdin can't be interrupted, so the thread
    // is detached and simply dies with the process.
    std::thread input_thread([]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_command_mutex);
            if (g_quit || !handle_command(line)) {
                break;
            }
        }
        // "quit" or EOF
        stop_host(0);
    });
    input_thread.detach();

    // wait for stop signal
    if (poll) {
        while (!g_semaphore.wait_for(0.01)) {
            g_bridge->pollEvents();
        }
        g_bridge->pollEvents();
    } else {
        g_semaphore.wait();
    }

    if (g_loglevel >= kVrbLogLevelVerbose) {
        std::cerr << "Program stopped" << std::endl;
    }

    // NB: release the bridge before the library
    {
        vrb::sync::scoped_lock<vrb::sync::mutex> lock(g_command_mutex);
        g_quit = true;
        g_bridge.reset();
    }

    vrb_terminate();

    return g_error_code == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
