// ─────────────────────────────────────────────────────────────────────────────
// wxstream-cli - streaming endpoint inspector
// ─────────────────────────────────────────────────────────────────────────────
// Connects to a text/event-stream endpoint and prints what arrives.
//
// Usage:
//   # Long-lived subscription (alerts, observations) with auto-reconnect
//   wxstream-cli subscribe --url "https://wx.example.com/api/alerts/stream"
//
//   # Ask a question and stream the answer token by token
//   wxstream-cli ask --url "https://wx.example.com/api/chat/stream" \
//                --query "Will it freeze tonight?" --location "KSEA"
//
// Features:
//   - Reconnect tuning (--max-attempts, --base-interval-ms, --no-reconnect)
//   - Stall watchdog (--stall-timeout-ms)
//   - Custom request headers, TLS options
//   - JSON lines output for scripting
//   - spdlog logging to stderr or a file

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "wxstream/log/spdlog_logger.hpp"
#include "wxstream/rag/rag_stream_session.hpp"
#include "wxstream/stream/event_source.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using namespace wxstream;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) {
    g_interrupted.store(true);
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_status(const std::string& msg) {
    std::cerr << color::c(color::dim) << msg << color::c(color::reset) << "\n";
}

std::pair<std::string, std::string> parse_header(const std::string& header) {
    const auto colon = header.find(':');
    if (colon == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon);
    std::string value = header.substr(colon + 1);
    while (value.empty() == false && value.front() == ' ') {
        value.erase(0, 1);
    }
    return {name, value};
}

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

/// Sleeps in short slices until pred() holds or Ctrl-C was pressed.
template <typename Pred>
void wait_until_done(Pred pred) {
    while (pred() == false && g_interrupted.load() == false) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

Json frame_to_json(const StreamFrame& frame) {
    Json j = {{"event", frame.event_type()}, {"data", frame.data}};
    if (frame.id) {
        j["id"] = *frame.id;
    }
    if (frame.retry) {
        j["retry"] = *frame.retry;
    }
    return j;
}

Json event_to_json(const RagStreamEvent& event) {
    Json j = {{"type", to_string(type_of(event))}, {"requestId", request_id_of(event)}};
    std::visit([&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RagToken>) {
            j["content"] = e.content;
        } else if constexpr (std::is_same_v<T, RagError>) {
            j["error"] = e.message;
            j["source"] = e.source == RagError::Source::Transport ? "transport" : "protocol";
        }
        if (e.metadata.is_null() == false) {
            j["metadata"] = e.metadata;
        }
    }, event);
    return j;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_subscribe(const std::string& url, EventSourceOptions options, bool json_output) {
    std::atomic<bool> closed{false};
    std::atomic<bool> failed{false};

    EventSourceListener listener;
    listener.on_open = [&] {
        if (json_output == false) {
            print_status("connected to " + url);
        }
    };
    listener.on_message = [&](const StreamFrame& frame) {
        if (json_output) {
            std::cout << frame_to_json(frame).dump() << std::endl;
            return;
        }
        std::cout << color::c(color::cyan) << frame.event_type() << color::c(color::reset);
        if (frame.id) {
            std::cout << color::c(color::dim) << " #" << *frame.id << color::c(color::reset);
        }
        std::cout << "\n" << frame.data << "\n" << std::endl;
    };
    listener.on_error = [&](const StreamError& error) {
        if (error.fatal) {
            failed.store(true);
            print_error(error.message);
        } else {
            std::cerr << color::c(color::yellow) << "connection lost: " << color::c(color::reset)
                      << error.message << "\n";
        }
    };
    listener.on_reconnecting = [&](std::size_t attempt, std::chrono::milliseconds delay) {
        print_status("reconnecting in " + std::to_string(delay.count()) + " ms (attempt " +
                     std::to_string(attempt) + ")");
    };
    listener.on_close = [&] {
        closed.store(true);
    };

    EventSource source(url, std::move(listener), std::move(options));
    if (auto connected = source.connect(); !connected) {
        print_error(connected.error().message);
        return 1;
    }

    wait_until_done([&] { return closed.load(); });
    source.disconnect();

    if (json_output == false && g_interrupted.load()) {
        print_status("disconnected");
    }
    return failed.load() ? 1 : 0;
}

int cmd_ask(const std::string& url, RagStreamRequest request, StreamTransportConfig config, bool json_output) {
    RagEventSink sink = [json_output](const RagStreamEvent& event) {
        if (json_output) {
            std::cout << event_to_json(event).dump() << std::endl;
            return;
        }
        std::visit([](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RagStart>) {
                std::cerr << color::c(color::dim) << "[" << e.request_id << "]" << color::c(color::reset) << "\n";
            } else if constexpr (std::is_same_v<T, RagToken>) {
                std::cout << e.content << std::flush;
            } else if constexpr (std::is_same_v<T, RagDone>) {
                std::cout << "\n";
                std::cerr << color::c(color::green) << "done" << color::c(color::reset);
                if (e.metadata.is_null() == false) {
                    std::cerr << color::c(color::dim) << " " << e.metadata.dump() << color::c(color::reset);
                }
                std::cerr << "\n";
            } else {
                std::cout << "\n";
                print_error(e.message);
            }
        }, event);
    };

    RagStreamSession session(url, std::move(request), std::move(sink), std::move(config));
    session.start();

    // run() is blocking; poll for Ctrl-C from here and cancel the request
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        wait_until_done([&] { return finished.load(); });
        if (finished.load() == false) {
            session.cancel();
        }
    });

    auto result = session.wait();
    finished.store(true);
    watcher.join();

    if (session.was_cancelled()) {
        print_status("cancelled");
        return 130;
    }
    if (!result) {
        return 1;
    }
    const auto transcript = session.transcript();
    return transcript.state().error ? 1 : 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("wxstream-cli", "Event stream client for weather endpoints");

    options.add_options()
        ("mode", "subscribe | ask", cxxopts::value<std::string>())
        ("u,url", "Stream endpoint URL (or WXSTREAM_URL env var)", cxxopts::value<std::string>())
        ("H,header", "HTTP header (can be repeated, format: 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))

        // ask
        ("q,query", "Question to ask (ask mode)", cxxopts::value<std::string>())
        ("location", "Location id sent with the question", cxxopts::value<std::string>())
        ("context", "Extra context sent with the question", cxxopts::value<std::string>())

        // subscribe
        ("max-attempts", "Reconnect attempts before giving up", cxxopts::value<std::size_t>()->default_value("5"))
        ("base-interval-ms", "First reconnect delay in milliseconds", cxxopts::value<long long>()->default_value("5000"))
        ("multiplier", "Reconnect delay multiplier", cxxopts::value<double>()->default_value("2.0"))
        ("no-reconnect", "Treat the first disconnect as fatal")
        ("honor-retry", "Use the server's retry: hint as the base interval")

        // transport
        ("stall-timeout-ms", "Reconnect when no bytes arrive for this long (0 = never)", cxxopts::value<long long>()->default_value("0"))
        ("connect-timeout-ms", "Connect timeout in milliseconds", cxxopts::value<long long>()->default_value("10000"))
        ("ca-cert", "CA bundle for TLS verification", cxxopts::value<std::string>())
        ("insecure", "Skip TLS certificate verification")

        // output
        ("j,json", "Print events as JSON lines")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("v,verbose", "Shorthand for --log-level debug")
        ("h,help", "Print usage");

    options.parse_positional({"mode"});
    options.positional_help("<subscribe|ask>");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << color::c(color::bold) << "  Subscription:\n" << color::c(color::reset);
            std::cout << "    wxstream-cli subscribe -u 'https://wx.example.com/api/alerts/stream'\n";
            std::cout << "    wxstream-cli subscribe -u 'http://localhost:8080/stream' --max-attempts 10 --base-interval-ms 1000\n\n";
            std::cout << color::c(color::bold) << "  Answer stream:\n" << color::c(color::reset);
            std::cout << "    wxstream-cli ask -u 'https://wx.example.com/api/chat/stream' -q 'Is it windy in Oslo?'\n";
            std::cout << "    wxstream-cli ask -u 'http://localhost:8080/chat' -q 'Rain tomorrow?' --location KSEA --json\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        // Logging
        const auto level = result.count("verbose")
            ? LogLevel::Debug
            : parse_log_level(result["log-level"].as<std::string>());
        if (level != LogLevel::Off) {
            if (result.count("log-file")) {
                set_logger(make_spdlog_file_logger(result["log-file"].as<std::string>(), level, true));
            } else {
                set_logger(make_spdlog_console_logger(level));
            }
        }

        if (result.count("mode") == 0) {
            print_error("Must specify a mode: subscribe or ask");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }
        const std::string mode = result["mode"].as<std::string>();

        const std::string url = result.count("url") ? result["url"].as<std::string>() : get_env("WXSTREAM_URL");
        if (url.empty()) {
            print_error("Stream URL required. Use --url or set WXSTREAM_URL environment variable");
            return 1;
        }

        StreamTransportConfig transport;
        transport.with_connect_timeout(std::chrono::milliseconds(result["connect-timeout-ms"].as<long long>()))
                 .with_stall_timeout(std::chrono::milliseconds(result["stall-timeout-ms"].as<long long>()))
                 .with_verify_ssl(result.count("insecure") == 0);
        if (result.count("ca-cert")) {
            transport.with_ca_cert(result["ca-cert"].as<std::string>());
        }
        for (const auto& header : result["header"].as<std::vector<std::string>>()) {
            if (header.empty() == false) {
                auto [name, value] = parse_header(header);
                transport.with_header(name, value);
            }
        }

        std::signal(SIGINT, on_sigint);

        if (mode == "subscribe") {
            ReconnectPolicy policy;
            policy.with_max_attempts(result["max-attempts"].as<std::size_t>())
                  .with_base_interval(std::chrono::milliseconds(result["base-interval-ms"].as<long long>()))
                  .with_multiplier(result["multiplier"].as<double>());

            EventSourceOptions source_options;
            source_options.with_reconnect(result.count("no-reconnect") == 0)
                          .with_reconnect_policy(policy)
                          .with_retry_hint(result.count("honor-retry") > 0)
                          .with_transport(std::move(transport));
            return cmd_subscribe(url, std::move(source_options), json_output);
        }

        if (mode == "ask") {
            if (result.count("query") == 0) {
                print_error("ask needs --query");
                return 1;
            }
            RagStreamRequest request;
            request.query = result["query"].as<std::string>();
            if (result.count("location")) {
                request.location_id = result["location"].as<std::string>();
            }
            if (result.count("context")) {
                request.context = result["context"].as<std::string>();
            }
            return cmd_ask(url, std::move(request), std::move(transport), json_output);
        }

        print_error("Unknown mode '" + mode + "' (expected subscribe or ask)");
        return 1;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
