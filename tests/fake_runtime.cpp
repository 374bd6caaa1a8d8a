/*
 * noclaw_fake_runtime - stands in for docker/podman in tests
 *
 *   --version          prints a version line
 *   rm -f <name>       records the removal
 *   run [flags] <image> <entrypoint...>
 *                      finds the workspace and request mounts in the -v
 *                      flags, reads the request and reacts to its prompt:
 *
 *     "task-fail"      {"success": false} document
 *     "fail"           partial stdout, message on stderr, exit 3
 *     "stubborn"       hangs and ignores SIGTERM
 *     "sleep"          hangs
 *     "garbage"        non-JSON stdout
 *     "sidecar"        writes .noclaw_output.json, then answers
 *     "instructions"   answers with the workspace CLAUDE.md
 *     "describe"       answers with the mounts and env names it was given
 *     "2+2"            {"response": "4"}
 *     anything else    {"response": "ok: <prompt>"}
 *
 * Every invocation is appended to $NOCLAW_FAKE_LOG when it is set.
 */
#include <noclaw/core/json.hpp>
#include <noclaw/core/utils.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace noclaw;

namespace {

void record(const std::string& line) {
    const char* log = getenv("NOCLAW_FAKE_LOG");
    if (!log || log[0] == '\0') return;
    FILE* f = fopen(log, "a");
    if (!f) return;
    fprintf(f, "%s\n", line.c_str());
    fclose(f);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

void respond(const std::string& text) {
    Json doc = Json::object();
    doc["response"] = text;
    std::cout << doc.dump() << std::endl;
}

int run(int argc, char** argv) {
    std::string workspace;
    std::string request_file;
    std::string name;
    Json mounts = Json::array();
    Json env_names = Json::array();

    int i = 2;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--rm") continue;
        if ((arg == "--name" || arg == "--memory" || arg == "--cpus" ||
             arg == "--security-opt" || arg == "-v" || arg == "-e") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--name") {
                name = value;
            } else if (arg == "-v") {
                std::vector<std::string> parts = split(value, ':');
                if (parts.size() != 3) {
                    std::cerr << "fake runtime: bad volume " << value << "\n";
                    return 125;
                }
                if (parts[1] == "/workspace") workspace = parts[0];
                else if (parts[1] == "/input.json") request_file = parts[0];
                mounts.push_back(value);
            } else if (arg == "-e") {
                env_names.push_back(value.substr(0, value.find('=')));
            }
            continue;
        }
        break;  // image
    }

    record("run " + name);

    if (workspace.empty() || request_file.empty()) {
        std::cerr << "fake runtime: missing /workspace or /input.json mount\n";
        return 125;
    }

    std::string text;
    if (!read_file(request_file, text)) {
        std::cerr << "fake runtime: cannot read " << request_file << "\n";
        return 125;
    }
    Json request = Json::parse(text, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        std::cerr << "fake runtime: request is not a JSON object\n";
        return 125;
    }
    std::string prompt = request.value("prompt", std::string());

    if (contains(prompt, "task-fail")) {
        Json doc = Json::object();
        doc["response"] = "Error executing request: agent refused";
        doc["error"] = "agent refused";
        doc["success"] = false;
        std::cout << doc.dump() << std::endl;
        return 0;
    }
    if (contains(prompt, "fail")) {
        std::cout << "partial" << std::flush;
        std::cerr << "boom" << std::endl;
        return 3;
    }
    if (contains(prompt, "stubborn")) {
        signal(SIGTERM, SIG_IGN);
        for (;;) {
            sleep(1);
        }
    }
    if (contains(prompt, "sleep")) {
        for (;;) {
            sleep(1);
        }
    }
    if (contains(prompt, "garbage")) {
        std::cout << "this is not json" << std::endl;
        return 0;
    }
    if (contains(prompt, "sidecar")) {
        Json task = Json::object();
        task["cron"] = "0 9 * * *";
        task["prompt"] = "morning summary";
        task["description"] = "morning summary";
        Json sidecar = Json::object();
        sidecar["scheduled_tasks"] = Json::array();
        sidecar["scheduled_tasks"].push_back(task);
        write_file(join_path(workspace, ".noclaw_output.json"), sidecar.dump());
        respond("scheduled");
        return 0;
    }
    if (contains(prompt, "instructions")) {
        std::string instructions;
        read_file(join_path(workspace, "CLAUDE.md"), instructions);
        respond(instructions);
        return 0;
    }
    if (contains(prompt, "describe")) {
        Json info = Json::object();
        info["mounts"] = mounts;
        info["env"] = env_names;
        info["history"] = request.value("history", Json::array());
        respond(info.dump());
        return 0;
    }
    if (contains(prompt, "2+2")) {
        respond("4");
        return 0;
    }
    respond("ok: " + prompt);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc >= 2 && strcmp(argv[1], "--version") == 0) {
        std::cout << "Fake runtime version 1.0" << std::endl;
        return 0;
    }
    if (argc >= 4 && strcmp(argv[1], "rm") == 0) {
        record(std::string("rm ") + argv[argc - 1]);
        return 0;
    }
    if (argc >= 2 && strcmp(argv[1], "run") == 0) {
        return run(argc, argv);
    }
    std::cerr << "fake runtime: unsupported command\n";
    return 125;
}
