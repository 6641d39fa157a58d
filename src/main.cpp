#include "config.hpp"
#include "client.hpp"
#include "cancel.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstdio>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: manax-example [options]\n"
              << "\n"
              << "Fetches the facts and matches snapshots for MANAX_PRO_ID, then\n"
              << "streams match updates until interrupted (Ctrl+C).\n"
              << "\n"
              << "Options:\n"
              << "  --direction D      Offer (default) or Seek\n"
              << "  --min-score X      Only matches scoring above X\n"
              << "  --limit N          Max items per chunk\n"
              << "  --once             Exit when the server closes the stream\n"
              << "  -h, --help         Show this help\n"
              << "\n"
              << "Environment:\n"
              << "  MANAX_BASE_URL, MANAX_PRO_ID, MANAX_PRO_TOKEN, MANAX_KEY, MANAX_TIMEOUT\n"
              << "  (override ~/.manax/config.json)\n";
}

static void print_match(const manax::MatchItem& m) {
    std::printf("[%s] match #%lld target=%s score=%.3f\n",
                manax::format_rfc3339(m.updated_utc).c_str(),
                static_cast<long long>(m.id),
                m.target_pro_id.c_str(),
                m.score);
    std::fflush(stdout);
}

// Sleep in small steps so Ctrl+C is honoured promptly.
static void wait_before_reconnect(std::chrono::seconds delay) {
    auto until = std::chrono::steady_clock::now() + delay;
    while (!g_shutdown.load() && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
}

int main(int argc, char* argv[]) try {
    manax::MatchesFilter filter;
    filter.direction = manax::MatchingDirection::Offer;
    bool once = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--direction") == 0 && i + 1 < argc) {
            filter.direction = manax::direction_from_string(argv[++i]);
        } else if (std::strcmp(argv[i], "--min-score") == 0 && i + 1 < argc) {
            filter.min_score = std::stod(argv[++i]);
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            filter.limit = std::stoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = manax::Config::load();
    if (config.base_url.empty()) {
        std::cerr << "MANAX_BASE_URL must be set for the example\n";
        return 1;
    }
    if (config.pro_id.empty()) {
        std::cerr << "MANAX_PRO_ID must be set for the example\n";
        return 1;
    }

    // Writes to a peer-closed socket must surface as errors, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    manax::PlatformHttpClient http_client;
    auto client = manax::Client::from_config(config, http_client);

    auto facts = client.get_facts_snapshot(config.pro_id);
    std::cerr << "[example] facts snapshot: " << facts.items.size()
              << " items (cursorId=" << facts.cursor_id << ")\n";

    auto matches = client.get_matches_snapshot(config.pro_id, filter);
    std::cerr << "[example] matches snapshot: " << matches.items.size()
              << " items (cursorId=" << matches.cursor_id << ")\n";
    for (const auto& m : matches.items) print_match(m);

    auto cursor = manax::MatchesCursor::from(matches);
    if (manax::is_zero(cursor.updated_utc)) {
        // Nothing matched yet: only follow changes from now on
        cursor.updated_utc = std::chrono::system_clock::now();
    }

    // Bridge Ctrl+C to the stream's cancel token
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    manax::CancelToken cancel;
    std::atomic<bool> done{false};
    std::thread watcher([&cancel, &done] {
        while (!done.load() && !g_shutdown.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (g_shutdown.load()) cancel.cancel();
    });

    std::cerr << "[example] starting matches stream; press Ctrl+C to stop\n";

    int rc = 0;
    try {
        while (true) {
            auto end = client.stream_matches(config.pro_id, cursor, filter,
                [&cursor](const manax::MatchesChunk& chunk) {
                    for (const auto& m : chunk.items) print_match(m);
                    auto next = manax::MatchesCursor::from(chunk);
                    if (cursor < next) cursor = next;
                    return true;
                },
                &cancel);
            if (end != manax::StreamEnd::ServerClosed || once) break;

            std::cerr << "[example] server closed the stream, reconnecting (cursorId="
                      << cursor.id << ")\n";
            wait_before_reconnect(std::chrono::seconds(1));
            if (g_shutdown.load()) break;
        }
    } catch (const manax::CancelledError&) {
        std::cerr << "[example] interrupted\n";
    } catch (const std::exception& e) {
        std::cerr << "StreamMatches failed: " << e.what() << "\n";
        rc = 1;
    }

    done.store(true);
    watcher.join();

    std::cerr << "[example] stream finished\n";
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
