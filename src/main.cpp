#include "config.hpp"
#include "pipeline.hpp"
#include "sinks/console_sink.hpp"
#include "util.hpp"
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

static void print_usage() {
    std::cout << "Usage: chatpace [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message TEXT   Deliver TEXT as one response and exit\n"
              << "  --file PATH          Deliver the contents of PATH and exit\n"
              << "  --stream             Feed the response in small deltas\n"
              << "  --mode NAME          Split mode (none, simple, simple_improved,\n"
              << "                       markdown, structured)\n"
              << "  --chat ID            Chat id (default: console)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without -m/--file an interactive session starts: every line is a\n"
              << "user message, answered by an echo responder. A line typed while a\n"
              << "response is being delivered interrupts it.\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status              Show the active delivery\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHATPACE_SPLIT_MODE      Split mode\n"
              << "  CHATPACE_MAX_CHUNK       Maximum chunk length (code points)\n"
              << "  CHATPACE_MIN_CHUNK       Minimum chunk length (code points)\n"
              << "  CHATPACE_DELAY_STRATEGY  none, constant, random, proportional\n"
              << "  CHATPACE_REPLY_MODE      auto, reply, answer\n";
}

static std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("cannot open " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Feed `text` a few code points at a time, as a model stream would
static void stream_text(chatpace::StreamChunkSource& source, const std::string& text) {
    constexpr size_t kDeltaCodePoints = 7;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = chatpace::utf8_advance(text, pos, kDeltaCodePoints);
        source.push(text.substr(pos, end - pos));
        pos = end;
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    source.close();
}

static void print_outcome(const chatpace::DeliveryScheduler& scheduler,
                          const std::string& chat_id) {
    auto outcome = scheduler.last_outcome(chat_id);
    if (!outcome) return;
    std::cerr << "[chatpace] turn " << outcome->turn_id << ": "
              << chatpace::session_status_name(outcome->status) << ", "
              << outcome->delivered_count << " chunk(s) delivered";
    if (!outcome->error.empty()) std::cerr << " (" << outcome->error << ")";
    std::cerr << "\n";
}

static int run_once(chatpace::DeliveryPipeline& pipeline, const std::string& chat_id,
                    const std::string& text, chatpace::SplitMode mode, bool stream) {
    chatpace::ChatContext ctx;
    ctx.chat_id = chat_id;

    if (stream) {
        auto delivery = pipeline.deliver_stream(ctx, {}, mode);
        if (delivery.result != chatpace::SubmitResult::Started) {
            std::cerr << "Error: delivery " << chatpace::submit_result_name(delivery.result) << "\n";
            return 1;
        }
        stream_text(*delivery.source, text);
    } else {
        chatpace::RawResponse response;
        response.text = text;
        response.mode = mode;
        auto result = pipeline.deliver(response, ctx);
        if (result != chatpace::SubmitResult::Started) {
            std::cerr << "Error: delivery " << chatpace::submit_result_name(result) << "\n";
            return 1;
        }
    }

    pipeline.scheduler().wait_idle();
    print_outcome(pipeline.scheduler(), chat_id);

    auto outcome = pipeline.scheduler().last_outcome(chat_id);
    return outcome && outcome->status == chatpace::SessionStatus::Completed ? 0 : 1;
}

static std::string echo_response(const std::string& message) {
    return "You said: \"" + message + "\". Let me think about that for a moment. "
           "There is quite a lot to unpack here, so I will take it one piece at a time. "
           "Type another line at any point to cut me off.";
}

static int run_repl(chatpace::DeliveryPipeline& pipeline, const std::string& chat_id,
                    chatpace::SplitMode mode) {
    pipeline.set_turn_handler([&pipeline, mode](const chatpace::Turn& turn) {
        chatpace::RawResponse response;
        response.text = echo_response(turn.message.raw_text);
        response.mode = mode;
        auto result = pipeline.deliver(response, pipeline.context_for(turn));
        if (result == chatpace::SubmitResult::Rejected) {
            std::cerr << "[chatpace] response to " << turn.message.message_id
                      << " rejected\n";
        }
    });

    std::cout << "chatpace console\n"
              << "Type a message, /status or /quit.\n\n";

    uint64_t next_message = 1;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/status") {
                auto active = pipeline.scheduler().active_session(chat_id);
                if (!active) {
                    std::cout << "No active delivery.\n";
                } else {
                    std::cout << "Turn " << active->turn_id << ": "
                              << chatpace::session_status_name(active->status) << ", "
                              << chatpace::mode_policy_name(active->policy) << ", "
                              << active->delivered_count << " chunk(s) delivered\n";
                }
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        chatpace::InterruptEvent ev;
        ev.chat_id = chat_id;
        ev.arrival_time = chatpace::epoch_millis();
        ev.raw_text = line;
        ev.message_id = "m" + std::to_string(next_message++);
        pipeline.interrupt(ev);
    }

    pipeline.scheduler().wait_idle();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string file_path;
    std::string mode_name;
    std::string chat_id = "console";
    bool stream = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
            file_path = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode_name = argv[++i];
        } else if (std::strcmp(argv[i], "--chat") == 0 && i + 1 < argc) {
            chat_id = argv[++i];
        } else if (std::strcmp(argv[i], "--stream") == 0) {
            stream = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = chatpace::Config::load();
    if (!mode_name.empty()) {
        config.split.mode = chatpace::parse_split_mode(mode_name);
    }
    config.validate();

    chatpace::ConsoleSink sink(std::cout);
    chatpace::DeliveryPipeline pipeline(sink, config);

    if (!file_path.empty()) message = read_file(file_path);
    if (!message.empty()) {
        return run_once(pipeline, chat_id, message, config.split.mode, stream);
    }
    return run_repl(pipeline, chat_id, config.split.mode);
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
