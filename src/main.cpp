#include <iostream>
#include <vector>
#include <string>
#include "cli/remora_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"

static void usage_row(const std::string& cmd, const std::string& arg, const std::string& desc) {
    std::cout << theme::color::BLUE << "    remora " << cmd << " "
              << theme::color::RESET << theme::color::BROWN << arg
              << theme::color::RESET << theme::color::DIM
              << std::string(arg.size() + cmd.size() < 22 ? 22 - arg.size() - cmd.size() : 1, ' ')
              << desc << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner(REMORA_VERSION);
    std::cout << theme::section("Usage");
    usage_row("test", "", "Check the SSH connection");
    usage_row("diagnose", "", "Connection test plus host key and tool checks");
    usage_row("launch", "[-- cmd...]", "Start the job in a detached tmux session");
    usage_row("status", "", "Session state and last exit code");
    usage_row("stop", "", "Kill the job's tmux session");
    usage_row("tail", "[--no-mirror]", "Follow the job log, mirroring it locally");
    usage_row("upload", "[dir]", "Copy local inputs to the remote inputs dir");
    usage_row("fetch", "[glob]", "Download outputs and verify the manifest");
    usage_row("cleanup", "[--dry-run]", "Remove remote outputs");
    usage_row("ensure-rsync", "", "Install rsync on the remote if missing");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <file>       Use this config instead of ~/.remora + ./remora.yaml\n"
              << "    --host <host>         Override ssh.host\n"
              << "    remora --version      Show version\n"
              << "    remora --help         Show this help"
              << theme::color::RESET << "\n\n";
}

static Result<Config> load_config(const std::string& config_path) {
    if (!config_path.empty()) return Config::load_file(config_path);

    if (!global_config_exists() && !project_config_exists()) {
        auto created = create_default_global_config();
        if (created.is_err()) return Result<Config>::Err(created.error);
        std::cout << theme::step("Wrote a starter config to " + get_global_config_path().string());
        std::cout << theme::step("Fill in ssh.host and ssh.user, then run: remora test");
    }
    return Config::load();
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        std::string config_path;
        std::string host_override;

        size_t i = 0;
        for (; i < args.size(); ++i) {
            const auto& a = args[i];
            if (a == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "remora"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << REMORA_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (a == "--help" || a == "-h") {
                print_usage();
                return 0;
            } else if (a == "--config" || a == "--host") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("Missing value for " + a);
                    return 1;
                }
                (a == "--config" ? config_path : host_override) = args[++i];
            } else {
                break;
            }
        }

        if (i >= args.size()) {
            print_usage();
            return 1;
        }
        std::string cmd = args[i];
        std::vector<std::string> rest(args.begin() + i + 1, args.end());
        auto has_flag = [&rest](const std::string& flag) {
            for (const auto& r : rest) {
                if (r == flag) return true;
            }
            return false;
        };
        auto first_arg = [&rest]() -> std::string {
            for (const auto& r : rest) {
                if (r.rfind("--", 0) != 0) return r;
            }
            return "";
        };

        auto loaded = load_config(config_path);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        Config config = std::move(loaded.value);
        config.apply_env_overrides();
        if (!host_override.empty()) config.set_host(host_override);

        RemoraCLI cli(std::move(config));

        if (cmd == "test") {
            return cli.run_test();
        } else if (cmd == "diagnose") {
            return cli.run_diagnose();
        } else if (cmd == "launch") {
            std::vector<std::string> command;
            if (!rest.empty() && rest.front() == "--") {
                command.assign(rest.begin() + 1, rest.end());
            } else {
                command = rest;
            }
            return cli.run_launch(command);
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "stop") {
            return cli.run_stop();
        } else if (cmd == "tail") {
            return cli.run_tail(!has_flag("--no-mirror"));
        } else if (cmd == "upload") {
            return cli.run_upload(first_arg());
        } else if (cmd == "fetch") {
            return cli.run_fetch(first_arg());
        } else if (cmd == "cleanup") {
            return cli.run_cleanup(has_flag("--dry-run"));
        } else if (cmd == "ensure-rsync") {
            return cli.run_ensure_rsync();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
