// SPDX-License-Identifier: Apache-2.0
// Part of the Mellon project.
// apps/mellon.cpp

#include "mellon/server.hpp"
#include "mellon/server_config.hpp"
#include "mellon/token_store.hpp"
#include "mellon/errors.hpp"
#include "mellon/log.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <csignal>
#include <pthread.h>
#include <signal.h>

static const char* kVersion = "0.1.0";

static void usage(const char* argv0) {
    std::cerr <<
      "A small, simple, fast auth service.\n\n"
      "Usage:\n"
      "  " << argv0 << " [options] serve [HOST:PORT]      (default " << mellon::kDefaultHostPort << ")\n"
      "  " << argv0 << " [options] token add <label>\n"
      "  " << argv0 << " [options] token rescind <label>\n"
      "  " << argv0 << " [options] token list\n"
      "  " << argv0 << " --version\n\n"
      "Options:\n"
      "  [--store <path>]          token file (default " << mellon::kDefaultStorePath << ")\n"
      "  [--log_file <path>]       append log lines to a file\n"
      "  [--quiet 0|1]             suppress console logs when 1\n"
      "  [--read_timeout <sec>]    header read deadline (serve, default 30, max 86400)\n"
      "  [--write_timeout <sec>]   response write timeout (serve, default 30, max 86400)\n"
      "  [--sequential 0|1]        serve connections on the accept thread (serve)\n\n"
      "A running server picks up token changes on restart or SIGHUP.\n";
}

// Prints a two-column ASCII table.
static void print_table(const std::vector<std::pair<std::string, std::string>>& rows) {
    std::size_t w1 = 0, w2 = 0;
    for (const auto& r : rows) {
        w1 = std::max(w1, r.first.size());
        w2 = std::max(w2, r.second.size());
    }
    const std::string rule = "+" + std::string(w1 + 2, '-') + "+" + std::string(w2 + 2, '-') + "+";
    std::cout << rule << '\n';
    for (std::size_t i = 0; i < rows.size(); ++i) {
        std::cout << "| " << rows[i].first  << std::string(w1 - rows[i].first.size(), ' ')
                  << " | " << rows[i].second << std::string(w2 - rows[i].second.size(), ' ')
                  << " |\n";
        if (i == 0) std::cout << rule << '\n';
    }
    std::cout << rule << '\n';
}

static int token_add(mellon::TokenStore& store, const std::string& label) {
    try {
        mellon::Token t = store.create(label);
        std::cout << t.secret << '\n';
        return 0;
    } catch (const mellon::Error& e) {
        std::cerr << "Failed to generate new token for label: " << e.what() << '\n';
        return 1;
    }
}

static int token_rescind(mellon::TokenStore& store, const std::string& label) {
    try {
        store.rescind(label);
        std::cout << "Token with label " << label
                  << " has been removed. Be sure to restart (or SIGHUP) the server to load changes!\n";
        return 0;
    } catch (const mellon::Error& e) {
        std::cerr << "Failed to rescind token: " << e.what() << '\n';
        return 1;
    }
}

static int token_list(const mellon::TokenStore& store) {
    try {
        std::vector<mellon::Token> tokens = store.list();
        std::sort(tokens.begin(), tokens.end(),
                  [](const mellon::Token& a, const mellon::Token& b) { return a.label < b.label; });
        std::vector<std::pair<std::string, std::string>> rows;
        rows.emplace_back("Label", "Token");
        for (const auto& t : tokens) {
            rows.emplace_back(t.label, mellon::mask_secret(t.secret));
        }
        print_table(rows);
        return 0;
    } catch (const mellon::Error& e) {
        std::cerr << "Unable to list tokens: " << e.what() << '\n';
        return 1;
    }
}

// SIGHUP reloads the store, SIGINT/SIGTERM stop the server. The signals are
// blocked in every thread and consumed here with sigwait(), so reload runs in
// ordinary thread context.
static void signal_loop(sigset_t set, mellon::TokenStore& store, mellon::Server& srv,
                        const std::atomic<bool>& done) {
    while (true) {
        int sig = 0;
        if (sigwait(&set, &sig) != 0) continue;
        if (done) return;
        if (sig == SIGHUP) {
            mellon::log_line("[INFO] SIGHUP: reloading " + store.path());
            try {
                store.reload();
                mellon::log_line("[INFO] Reload done: " + std::to_string(store.size()) + " token(s)");
            } catch (const mellon::Error& e) {
                mellon::log_line(std::string("[WARN] Reload failed, keeping previous tokens: ") + e.what());
            }
            continue;
        }
        mellon::log_line("[INFO] Signal " + std::to_string(sig) + " received, shutting down...");
        srv.stop();
        return;
    }
}

static int serve(mellon::TokenStore& store, const mellon::ServerConfig& cfg) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    // Must happen before any thread is spawned so handlers inherit the mask.
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
        std::cerr << "[FATAL] cannot block signals\n";
        return 1;
    }

    mellon::Server srv(cfg, store);
    std::atomic<bool> done{false};
    std::thread sig_thread(signal_loop, set, std::ref(store), std::ref(srv), std::cref(done));

    int rc = 0;
    std::cout << "Server starting up on " << cfg.host << ":" << cfg.port << std::endl;
    try {
        srv.run();  // blocking
        std::cout << "Server shut down!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Failed to host server: " << e.what() << "\n";
        rc = 1;
    }

    // Wake the signal thread if it is still waiting.
    done = true;
    (void)pthread_kill(sig_thread.native_handle(), SIGTERM);
    sig_thread.join();
    return rc;
}

int main(int argc, char** argv) {
    mellon::ServerConfig cfg;
    bool quiet = false;
    std::vector<std::string> pos;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--store" && i+1 < argc) cfg.store_path = argv[++i];
            else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else if (a == "--read_timeout" && i+1 < argc) cfg.read_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--write_timeout" && i+1 < argc) cfg.write_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--sequential" && i+1 < argc) cfg.sequential = (std::stoi(argv[++i]) != 0);
            else if (a == "--version" || a == "-V") { std::cout << "mellon " << kVersion << '\n'; return 0; }
            else if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
            else if (a.size() > 1 && a[0] == '-') { usage(argv[0]); return 2; }
            else pos.push_back(a);
        }
    } catch (const std::exception&) {
        // std::stoi on a non-numeric flag value
        usage(argv[0]);
        return 2;
    }
    if (pos.empty() ||
        cfg.read_timeout_sec <= 0 || cfg.read_timeout_sec > mellon::kMaxTimeoutSec ||
        cfg.write_timeout_sec <= 0 || cfg.write_timeout_sec > mellon::kMaxTimeoutSec) {
        usage(argv[0]);
        return 2;
    }

    const std::string& cmd = pos[0];
    const bool is_serve = (cmd == "serve");
    if (is_serve) {
        if (pos.size() > 2) { usage(argv[0]); return 2; }
        const std::string hostport = pos.size() == 2 ? pos[1] : mellon::kDefaultHostPort;
        if (!mellon::parse_host_port(hostport, cfg)) {
            std::cerr << "Host is not defined properly: " << hostport << "\n";
            return 2;
        }
    } else if (cmd == "token") {
        const bool needs_label = pos.size() >= 2 && (pos[1] == "add" || pos[1] == "rescind");
        const bool ok = (needs_label && pos.size() == 3) || (pos.size() == 2 && pos[1] == "list");
        if (!ok) { usage(argv[0]); return 2; }
    } else {
        usage(argv[0]);
        return 2;
    }

    // Admin commands print results on stdout; keep log lines off it.
    mellon::set_log_quiet(quiet || !is_serve);
    if (!cfg.log_file.empty()) {
        mellon::set_log_file(cfg.log_file);
    }

    try {
        mellon::TokenStore store(cfg.store_path);
        if (is_serve) return serve(store, cfg);
        if (pos[1] == "add") return token_add(store, pos[2]);
        if (pos[1] == "rescind") return token_rescind(store, pos[2]);
        return token_list(store);
    } catch (const mellon::Error& e) {
        std::cerr << "Failed to instantiate token store: " << e.what() << "\n";
        return 1;
    }
}
