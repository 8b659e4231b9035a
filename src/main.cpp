#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <iterator>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/dispatcher.hpp"
#include "worker.hpp"
using namespace std;
using namespace quest;
using namespace quest::engine;

static volatile sig_atomic_t interrupted = 0;

void signal_handler(int /* signum */) {
    interrupted = 1;
}

/**
 * @brief 按行读取标准输入，等待输入时会检查是否收到了中断信号
 */
struct line_reader {
    bool next(string &line) {
        while (true) {
            auto pos = buffer.find('\n');
            if (pos != string::npos) {
                line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                return true;
            }
            if (eof) {
                if (buffer.empty()) return false;
                line.swap(buffer);
                buffer.clear();
                return true;
            }
            if (interrupted) return false;

            struct pollfd pfd;
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int r = poll(&pfd, 1, 200);
            if (r < 0 && errno != EINTR) throw system_error(errno, system_category(), "waiting for input");
            if (r <= 0) continue;

            char buf[4096];
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw system_error(errno, system_category(), "reading input");
            }
            if (n == 0)
                eof = true;
            else
                buffer.append(buf, n);
        }
    }

private:
    string buffer;
    bool eof = false;
};

static void print_json(const nlohmann::json &j) {
    // 用户程序的输出不一定是合法的 UTF-8
    cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
}

static nlohmann::json error_record(const string &id, const string &error, const string &message) {
    nlohmann::json j = {{"error", error}, {"message", message}};
    if (!id.empty()) j["id"] = id;
    return j;
}

/**
 * @brief 等待执行结果，等待期间收到中断信号时停止执行池
 */
static execution_result wait_result(future<execution_result> &result, execution_pool &pool) {
    while (result.wait_for(chrono::milliseconds(100)) != future_status::ready) {
        if (interrupted) {
            LOG(ERROR) << "Received interrupt, stopping execution pool";
            pool.stop();
        }
    }
    return result.get();
}

static int run_single(const string &request_path, execution_pool &pool) {
    string content;
    if (request_path == "-")
        content.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    else
        content = read_file_content(request_path, "");

    execution_request request;
    try {
        request = nlohmann::json::parse(content).get<execution_request>();
    } catch (unsupported_configuration &ex) {
        print_json(error_record("", "unsupported_configuration", ex.what()));
        return E_UNSUPPORTED_CONFIGURATION;
    } catch (invalid_request &ex) {
        print_json(error_record("", "invalid_request", ex.what()));
        return E_INVALID_REQUEST;
    } catch (nlohmann::json::exception &ex) {
        print_json(error_record("", "invalid_request", ex.what()));
        return E_INVALID_REQUEST;
    }

    try {
        auto future = pool.submit(request);
        execution_result result = wait_result(future, pool);
        print_json(result);
        return result.stat == status::INTERNAL_ERROR ? E_INTERNAL_ERROR : E_SUCCESS;
    } catch (unsupported_configuration &ex) {
        print_json(error_record(request.id, "unsupported_configuration", ex.what()));
        return E_UNSUPPORTED_CONFIGURATION;
    } catch (invalid_request &ex) {
        print_json(error_record(request.id, "invalid_request", ex.what()));
        return E_INVALID_REQUEST;
    } catch (admission_rejected &ex) {
        print_json(error_record(request.id, "admission_rejected", ex.what()));
        return E_FAILURE;
    }
}

/**
 * @brief 批处理模式：从标准输入按行读取 JSON 请求，按输入顺序每行输出一个 JSON 结果
 */
static int run_batch(execution_pool &pool) {
    struct pending {
        string id;
        future<execution_result> result;
        nlohmann::json immediate;
    };
    concurrent_queue<shared_ptr<pending>> outputs;

    thread printer([&] {
        while (auto next = outputs.pop()) {
            auto &item = *next;
            if (!item->immediate.is_null()) {
                print_json(item->immediate);
                continue;
            }
            try {
                print_json(wait_result(item->result, pool));
            } catch (unsupported_configuration &ex) {
                print_json(error_record(item->id, "unsupported_configuration", ex.what()));
            } catch (invalid_request &ex) {
                print_json(error_record(item->id, "invalid_request", ex.what()));
            } catch (admission_rejected &ex) {
                print_json(error_record(item->id, "admission_rejected", ex.what()));
            }
        }
    });

    line_reader reader;
    string line;
    while (reader.next(line)) {
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        auto item = make_shared<pending>();
        try {
            nlohmann::json j = nlohmann::json::parse(line);
            if (j.is_object() && j.count("id") && j.at("id").is_string()) item->id = j.at("id").get<string>();
            execution_request request = j.get<execution_request>();
            item->result = pool.enqueue(move(request));
        } catch (unsupported_configuration &ex) {
            item->immediate = error_record(item->id, "unsupported_configuration", ex.what());
        } catch (invalid_request &ex) {
            item->immediate = error_record(item->id, "invalid_request", ex.what());
        } catch (nlohmann::json::exception &ex) {
            item->immediate = error_record(item->id, "invalid_request", ex.what());
        } catch (admission_rejected &ex) {
            item->immediate = error_record(item->id, "admission_rejected", ex.what());
            outputs.push(item);
            break;
        }
        outputs.push(item);
    }

    if (interrupted) {
        LOG(ERROR) << "Received interrupt, stopping execution pool";
        pool.stop();
    }
    outputs.close();
    printer.join();
    return interrupted ? E_FAILURE : E_SUCCESS;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("quest-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load engine configuration from the given JSON file. You can either pass it from environ QUEST_CONFIG")
        ("request", po::value<string>(), "execute the request in the given JSON file, or read it from stdin if the path is -")
        ("batch", "read newline-delimited JSON requests from stdin and write one JSON result per line")
        ("workspace-root", po::value<string>(), "set the directory where per-request workspaces are created. You can either pass it from environ QUEST_WORKSPACE_ROOT")
        ("concurrency", po::value<unsigned>(), "set the number of concurrent executions")
        ("list-runners", "list supported language/framework combinations")
        ("verbose", "log to stderr, including every spawned command")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_FAILURE;
    }

    if (vm.count("help")) {
        cout << "quest-runner: execute untrusted code submissions under time, output and resource limits" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "quest-runner 1.0" << endl;
        return E_SUCCESS;
    }

    if (vm.count("verbose")) {
        FLAGS_logtostderr = true;
        FLAGS_v = 1;
    }

    engine_config config = engine_config::defaults();
    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else if (getenv("QUEST_CONFIG")) {
        config_path = getenv("QUEST_CONFIG");
    }
    if (!config_path.empty()) {
        CHECK(filesystem::is_regular_file(config_path))
            << "Configuration file " << config_path << " does not exist";
        try {
            config = load_config(config_path);
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
        }
    }

    if (vm.count("workspace-root")) {
        config.workspace_root = vm.at("workspace-root").as<string>();
    } else if (getenv("QUEST_WORKSPACE_ROOT")) {
        config.workspace_root = getenv("QUEST_WORKSPACE_ROOT");
    }

    if (vm.count("concurrency")) {
        config.max_concurrent_executions = vm.at("concurrency").as<unsigned>();
    }

    CHECK(config.max_concurrent_executions > 0)
        << "maxConcurrentExecutions should be positive";
    CHECK(config.max_queued_executions > 0)
        << "maxQueuedExecutions should be positive";
    CHECK(config.default_time_limit_millis > 0)
        << "defaultTimeLimitMillis should be positive";
    CHECK(config.default_max_output_bytes > 0)
        << "defaultMaxOutputBytes should be positive";

    // 工作目录中的用户代码只允许当前用户读写
    umask(0077);

    filesystem::create_directories(config.workspace_root);
    CHECK(filesystem::is_directory(config.workspace_root))
        << "Workspace root " << config.workspace_root << " does not exist";

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    workspace_manager workspaces(config.workspace_root);
    dispatcher dispatcher(config, workspaces);

    if (vm.count("list-runners")) {
        for (auto &name : dispatcher.registry().list())
            cout << name << endl;
        return E_SUCCESS;
    }

    if (!vm.count("request") && !vm.count("batch")) {
        cerr << "either --request or --batch should be specified" << endl
             << endl;
        cerr << desc << endl;
        return E_FAILURE;
    }

    workspaces.start_sweeper(chrono::seconds(config.sweep_interval_seconds), chrono::seconds(config.orphan_age_seconds));

    int exitcode;
    {
        execution_pool pool(dispatcher, config.max_concurrent_executions, config.max_queued_executions);
        try {
            if (vm.count("request"))
                exitcode = run_single(vm.at("request").as<string>(), pool);
            else
                exitcode = run_batch(pool);
        } catch (std::exception &ex) {
            LOG(ERROR) << "quest-runner crashed: " << boost::diagnostic_information(ex);
            exitcode = E_INTERNAL_ERROR;
        }
    }

    workspaces.stop_sweeper();
    return exitcode;
}
