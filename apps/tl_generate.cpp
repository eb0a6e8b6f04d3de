/**
 * @file tl_generate.cpp
 * @brief Text generation CLI over the reference CPU backend
 *
 * Usage: tl_generate "prompt text" [--max-tokens N] [--temperature T]
 *                    [--top-k K] [--top-p P] [--min-p P] [--seed S]
 *                    [--timeout-ms MS] [--stop STR] [--set Key=Value]...
 *                    [--chat] [--chat-format chatml|llama|phi3|auto]
 *                    [--system TEXT] [--ctx N] [--delay-us US]
 *                    [--metrics json|prom]
 *
 * --chat reads one user turn per stdin line after the first prompt and
 * keeps the KV cache across turns; a "/forget" line empties the cached KV
 * state of the conversation. Ctrl-C cancels the running generation.
 * TL_LOG_LEVEL sets the log level.
 */

#include "tokenloom/ConversationSession.hpp"
#include "tokenloom/GenerationOptions.hpp"
#include "tokenloom/InferenceEngine.hpp"
#include "tokenloom/KvCacheStore.hpp"
#include "tokenloom/metrics.h"
#include "model/byte_tokenizer.hpp"
#include "model/reference_model.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_stop = 0;
static void signal_handler(int) { g_stop = 1; }

static void usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s \"prompt\" [options]\n"
        "  --max-tokens N      MaxNewTokens (default 100)\n"
        "  --temperature T     Temperature (default 0.8)\n"
        "  --top-k K           TopK (default 40)\n"
        "  --top-p P           TopP (default 0.95)\n"
        "  --min-p P           MinP (default 0)\n"
        "  --seed S            deterministic sampling\n"
        "  --timeout-ms MS     wall-clock budget\n"
        "  --stop STR          add a stop sequence\n"
        "  --set Key=Value     any GenerationOptions key\n"
        "  --chat              multi-turn mode, further turns from stdin\n"
        "  --chat-format F     chatml | llama | phi3 | auto\n"
        "  --system TEXT       system prompt for --chat\n"
        "  --ctx N             reference model context length (default 512)\n"
        "  --delay-us US       simulated per-forward latency\n"
        "  --metrics FMT       print metrics as json or prom on exit\n",
        prog);
}

static void print_result(const tl::GenerationResult& r) {
    std::fprintf(stderr,
        "\n[tl_generate] %s, finish=%s, prompt %u tok (reused %u), %zu tok generated, "
        "prefill %.1f ms, decode %.1f ms\n",
        tl_status_str(r.status), tl_finish_reason_str(r.finish_reason),
        r.prompt_tokens, r.reused_tokens, r.tokens.size(),
        r.prefill_us / 1000.0, r.decode_us / 1000.0);
    if (!r.ok() && !r.error.empty())
        std::fprintf(stderr, "[tl_generate] error: %s\n", r.error.c_str());
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(argv[0]); return 1; }
    tl_log_init_from_env();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string prompt = argv[1];
    tl::GenerationOptions opts;
    tl::ReferenceModel::Config mcfg;
    bool chat_mode = false;
    tl::ChatFormat fmt = tl::ChatFormat::AUTO;
    std::string system_prompt;
    const char* metrics_fmt = nullptr;

    for (int i = 2; i < argc; ++i) {
        std::string err;
        tl_status st = TL_OK;
        if (std::strcmp(argv[i], "--max-tokens") == 0 && i + 1 < argc)
            st = opts.set("MaxNewTokens", argv[++i], &err);
        else if (std::strcmp(argv[i], "--temperature") == 0 && i + 1 < argc)
            st = opts.set("Temperature", argv[++i], &err);
        else if (std::strcmp(argv[i], "--top-k") == 0 && i + 1 < argc)
            st = opts.set("TopK", argv[++i], &err);
        else if (std::strcmp(argv[i], "--top-p") == 0 && i + 1 < argc)
            st = opts.set("TopP", argv[++i], &err);
        else if (std::strcmp(argv[i], "--min-p") == 0 && i + 1 < argc)
            st = opts.set("MinP", argv[++i], &err);
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
            st = opts.set("Seed", argv[++i], &err);
        else if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc)
            st = opts.set("TimeoutMs", argv[++i], &err);
        else if (std::strcmp(argv[i], "--stop") == 0 && i + 1 < argc)
            opts.stop_sequences.emplace_back(argv[++i]);
        else if (std::strcmp(argv[i], "--set") == 0 && i + 1 < argc)
            st = tl::parse_options(argv[++i], opts, &err);
        else if (std::strcmp(argv[i], "--chat") == 0)
            chat_mode = true;
        else if (std::strcmp(argv[i], "--chat-format") == 0 && i + 1 < argc) {
            const char* f = argv[++i];
            if (std::strcmp(f, "chatml") == 0)      fmt = tl::ChatFormat::CHATML;
            else if (std::strcmp(f, "llama") == 0)  fmt = tl::ChatFormat::LLAMA;
            else if (std::strcmp(f, "phi3") == 0)   fmt = tl::ChatFormat::PHI3;
            else if (std::strcmp(f, "auto") != 0) {
                std::fprintf(stderr, "Unknown chat format: %s\n", f);
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--system") == 0 && i + 1 < argc)
            system_prompt = argv[++i];
        else if (std::strcmp(argv[i], "--ctx") == 0 && i + 1 < argc)
            mcfg.context_length = static_cast<uint32_t>(std::atoi(argv[++i]));
        else if (std::strcmp(argv[i], "--delay-us") == 0 && i + 1 < argc)
            mcfg.forward_delay_us = static_cast<uint32_t>(std::atoi(argv[++i]));
        else if (std::strcmp(argv[i], "--metrics") == 0 && i + 1 < argc)
            metrics_fmt = argv[++i];
        else {
            usage(argv[0]);
            return 1;
        }
        if (st != TL_OK) {
            std::fprintf(stderr, "Invalid option: %s\n", err.c_str());
            return 1;
        }
    }

    std::string err;
    if (opts.validate(&err) != TL_OK) {
        std::fprintf(stderr, "Invalid options: %s\n", err.c_str());
        return 1;
    }

    tl::ReferenceModel model(mcfg);
    tl::ByteTokenizer tokenizer;
    tl::InferenceEngine engine(model.handle(), tokenizer.handle());

    /* Ctrl-C -> stop_source, outside the signal handler. */
    std::stop_source stop;
    std::jthread watcher([&stop](std::stop_token done) {
        while (!done.stop_requested()) {
            if (g_stop) { stop.request_stop(); return; }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    });

    auto sink = [](const tl::GeneratedToken& t) {
        std::fwrite(t.text.data(), 1, t.text.size(), stdout);
        std::fflush(stdout);
    };

    int rc = 0;
    if (!chat_mode) {
        std::unique_ptr<tl::GenerationSession> session;
        if (engine.create_session(opts, &session, &err) != TL_OK) {
            std::fprintf(stderr, "Session creation failed: %s\n", err.c_str());
            return 1;
        }
        tl::GenerationResult r = engine.generate(*session, prompt, stop.get_token(), sink);
        print_result(r);
        rc = r.ok() ? 0 : 1;
    } else {
        tl::KvCacheStore store;
        tl::ConversationSession::Options copts;
        copts.format = fmt;
        copts.system_prompt = system_prompt;
        copts.generation = opts;
        tl::ConversationSession convo(engine, store, copts);
        if (convo.status() != TL_OK) {
            std::fprintf(stderr, "Conversation setup failed: %s\n", convo.init_error().c_str());
            return 1;
        }
        std::fprintf(stderr, "[tl_generate] chat mode: %s format\n",
                     tl::chat_format_str(convo.chat_template().format()));

        std::string line = prompt;
        do {
            if (line.empty()) continue;
            if (line == "/forget") {
                tl_status st = store.reset(convo.session_id());
                std::fprintf(stderr, "[tl_generate] forget: %s\n> ", tl_status_str(st));
                continue;
            }
            tl::GenerationResult r = convo.send(line, stop.get_token(), sink);
            print_result(r);
            if (r.status == TL_ERROR_CANCELLED) { rc = 1; break; }
            std::fprintf(stderr, "> ");
        } while (!g_stop && std::getline(std::cin, line));

        tl::KvCacheStore::Stats ks = store.stats();
        std::fprintf(stderr, "[tl_generate] kv: hits=%llu misses=%llu reused=%llu tokens\n",
                     (unsigned long long)ks.hits, (unsigned long long)ks.misses,
                     (unsigned long long)ks.reused_tokens);
    }

    if (metrics_fmt) {
        char buf[4096];
        if (std::strcmp(metrics_fmt, "prom") == 0) tl_metrics_to_prometheus(buf, sizeof(buf));
        else                                        tl_metrics_to_json(buf, sizeof(buf));
        std::fprintf(stderr, "%s\n", buf);
    }

    watcher.request_stop();
    return rc;
}
