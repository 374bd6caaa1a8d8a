/*
 * noclaw C++ - Application Implementation
 */
#include <noclaw/core/application.hpp>
#include <noclaw/core/logger.hpp>
#include <noclaw/core/utils.hpp>

#include <iostream>
#include <sstream>
#include <cstring>

namespace noclaw {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - sandboxed task execution\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config <file>        JSON configuration file\n"
              << "  --user <name>          User the request runs for\n"
              << "  --workspace <dir>      Workspace (default: <data_dir>/workspaces/<user>)\n"
              << "  --prompt <text>        Prompt (read from stdin when omitted)\n"
              << "  --model <hint>         low, mid or high\n"
              << "  --context <key=value>  Extra context, repeatable\n"
              << "  --instructions <file>  Written to the workspace as CLAUDE.md\n"
              << "  --local                Run in-process, without a container\n"
              << "  --explain              Describe the security model and exit\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version\n\n"
              << "Example:\n"
              << "  " << prog << " --user alice --prompt \"What is 2+2?\"\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application::Application()
    : force_local_(false)
    , explain_(false)
    , exit_code_(EXIT_OK)
{}

bool Application::parse_args(int argc, char* argv[]) {
    bool have_prompt = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(argv[i], "--local") == 0) {
            force_local_ = true;
            continue;
        }
        if (strcmp(argv[i], "--explain") == 0) {
            explain_ = true;
            continue;
        }

        // Everything below takes a value
        if (i + 1 >= argc) {
            std::cerr << "Unknown option or missing value: " << argv[i] << "\n";
            exit_code_ = EXIT_STARTUP_FAILURE;
            return false;
        }
        std::string value = argv[i + 1];

        if (strcmp(argv[i], "--config") == 0) {
            config_file_ = value;
        } else if (strcmp(argv[i], "--user") == 0) {
            context_.user = value;
        } else if (strcmp(argv[i], "--workspace") == 0) {
            context_.workspace_path = value;
        } else if (strcmp(argv[i], "--prompt") == 0) {
            context_.prompt = value;
            have_prompt = true;
        } else if (strcmp(argv[i], "--model") == 0) {
            if (!parse_model_hint(value, context_.model_hint)) {
                std::cerr << "Invalid model hint: " << value << " (expected low, mid or high)\n";
                exit_code_ = EXIT_STARTUP_FAILURE;
                return false;
            }
        } else if (strcmp(argv[i], "--context") == 0) {
            size_t eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Invalid context entry: " << value << " (expected key=value)\n";
                exit_code_ = EXIT_STARTUP_FAILURE;
                return false;
            }
            context_.extra_context[value.substr(0, eq)] = value.substr(eq + 1);
        } else if (strcmp(argv[i], "--instructions") == 0) {
            if (!read_file(value, context_.instructions)) {
                std::cerr << "Cannot read instructions file: " << value << "\n";
                exit_code_ = EXIT_STARTUP_FAILURE;
                return false;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            exit_code_ = EXIT_STARTUP_FAILURE;
            return false;
        }
        ++i;
    }

    if (!explain_ && !have_prompt && !read_prompt()) {
        exit_code_ = EXIT_STARTUP_FAILURE;
        return false;
    }
    return true;
}

bool Application::read_prompt() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    context_.prompt = trim(ss.str());
    if (context_.prompt.empty()) {
        std::cerr << "No prompt given (use --prompt or pipe it on stdin)\n";
        return false;
    }
    return true;
}

void Application::setup_logging() {
    std::string name = config_.get_string("log_level", "info");
    LogLevel level = LogLevel::INFO;
    if (parse_log_level(name, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s', using info", name.c_str());
    }
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            LOG_ERROR("Failed to load config from %s", config_file_.c_str());
            exit_code_ = EXIT_STARTUP_FAILURE;
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }
    config_.apply_env_overrides();
    setup_logging();

    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (explain_) {
        return true;
    }

    if (!engine_.init(config_, force_local_)) {
        std::cerr << "Startup failed: " << engine_.init_error() << "\n";
        exit_code_ = EXIT_STARTUP_FAILURE;
        return false;
    }
    return true;
}

int Application::run() {
    if (explain_) {
        PathPolicy policy = PathPolicy::from_config(config_);
        std::cout << policy.explain();
        return EXIT_OK;
    }

    if (context_.user.empty() && context_.workspace_path.empty()) {
        context_.user = "default";
    }

    ExecutionResult result = engine_.run(context_);
    std::cout << result.to_json().dump(2) << std::endl;
    return result.ok() ? EXIT_OK : EXIT_RESULT_ERROR;
}

} // namespace noclaw
