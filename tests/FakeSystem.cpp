#include "FakeSystem.hpp"
#include "infrastructure/config_writer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <stdexcept>

namespace nextu
{
    namespace test
    {

        namespace
        {
            std::vector<std::string> without_flags(const std::vector<std::string> &args)
            {
                std::vector<std::string> out;
                for (const auto &arg : args)
                {
                    if (arg != "-o" && arg != "-4")
                    {
                        out.push_back(arg);
                    }
                }
                return out;
            }

            core::CommandResult result(int exit_code, const std::string &output = "")
            {
                core::CommandResult r;
                r.exit_code = exit_code;
                r.output = output;
                return r;
            }

            std::string basename_of(const std::string &path)
            {
                return std::filesystem::path(path).filename().string();
            }
        }

        TempDir::TempDir()
        {
            std::string templ = (std::filesystem::temp_directory_path() / "nextu-hotspot-test-XXXXXX").string();
            if (!mkdtemp(templ.data()))
            {
                throw std::runtime_error("mkdtemp failed");
            }
            path_ = templ;
        }

        TempDir::~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        core::CommandResult FakeSystem::run(const std::vector<std::string> &argv)
        {
            history.push_back(argv);
            if (argv.empty())
            {
                return result(127, "empty command");
            }

            const auto rendered = core::format_command(argv);
            for (const auto &[prefix, failure] : failures_)
            {
                if (rendered.compare(0, prefix.size(), prefix) == 0)
                {
                    return result(failure.exit_code, failure.output);
                }
            }

            const std::vector<std::string> args(argv.begin() + 1, argv.end());
            const auto program = basename_of(argv[0]);

            if (program == "ip")
            {
                return run_ip(args);
            }
            if (program == "iw")
            {
                return run_iw(args);
            }
            if (program == "iptables")
            {
                return run_iptables(args);
            }
            if (program == "sysctl")
            {
                if (args.size() == 2 && args[0] == "-w" && args[1] == "net.ipv4.ip_forward=1")
                {
                    ip_forward = true;
                    return result(0, "net.ipv4.ip_forward = 1\n");
                }
                return result(255, "sysctl: unsupported invocation");
            }
            if (program == "nmcli")
            {
                // nmcli device set IF managed yes|no
                if (args.size() == 5 && interfaces.count(args[2]))
                {
                    interfaces[args[2]].managed = args[4] == "yes";
                    return result(0);
                }
                return result(10, "Error: Device not found.");
            }
            if (program == "hostapd" || program == "dnsmasq")
            {
                return run_daemon(program, args);
            }

            return result(127, argv[0] + ": command not found");
        }

        core::CommandResult FakeSystem::run_ip(const std::vector<std::string> &raw)
        {
            const auto args = without_flags(raw);
            if (args.size() < 3)
            {
                return result(255, "Command line is not complete.");
            }

            const std::string &object = args[0];
            const std::string &verb = args[1];
            const std::string name = args.back() == "up" || args.back() == "down" ? args[2] : args.back();

            auto it = interfaces.find(name);
            if (it == interfaces.end())
            {
                return result(1, "Device \"" + name + "\" does not exist.\n");
            }
            auto &iface = it->second;

            if (object == "link" && verb == "show")
            {
                std::string output = "3: " + name + ": <BROADCAST,MULTICAST";
                output += iface.up ? ",UP,LOWER_UP> " : "> ";
                output += "mtu 1500 qdisc mq state ";
                output += iface.up ? "UP" : "DOWN";
                output += " mode DEFAULT group default qlen 1000\\    link/ether " + iface.mac + " brd ff:ff:ff:ff:ff:ff\n";
                return result(0, output);
            }
            if (object == "link" && verb == "set")
            {
                iface.up = args.back() == "up";
                return result(0);
            }
            if (object == "addr" && verb == "show")
            {
                std::string output;
                for (const auto &address : iface.addresses)
                {
                    output += "3: " + name + "    inet " + address + " scope global " + name +
                              "\\       valid_lft forever preferred_lft forever\n";
                }
                return result(0, output);
            }
            if (object == "addr" && verb == "flush")
            {
                iface.addresses.clear();
                return result(0);
            }
            if (object == "addr" && verb == "add")
            {
                const auto &cidr = args[2];
                if (std::find(iface.addresses.begin(), iface.addresses.end(), cidr) != iface.addresses.end())
                {
                    return result(2, "RTNETLINK answers: File exists\n");
                }
                iface.addresses.push_back(cidr);
                return result(0);
            }
            return result(255, "Object \"" + object + "\" is unknown, try \"ip help\".");
        }

        core::CommandResult FakeSystem::run_iw(const std::vector<std::string> &args)
        {
            if (iw_unavailable)
            {
                return result(127, "iw: command not found");
            }
            if (args.size() == 3 && args[0] == "reg" && args[1] == "set")
            {
                regulatory_country = args[2];
                return result(0);
            }
            if (args.size() == 2 && args[0] == "reg" && args[1] == "get")
            {
                return result(0, "global\ncountry " + regulatory_country + ": DFS-FCC\n\t(2402 - 2472 @ 40), (N/A, 30), (N/A)\n");
            }
            if (args.size() == 3 && args[0] == "dev" && args[2] == "info")
            {
                if (!interfaces.count(args[1]))
                {
                    return result(237, "command failed: No such device (-19)\n");
                }
                const bool ap = live_pid("hostapd") != 0;
                return result(0, "Interface " + args[1] + "\n\tifindex 3\n\ttype " + (ap ? "AP" : "managed") + "\n");
            }
            return result(1, "Usage: iw [options] command");
        }

        core::CommandResult FakeSystem::run_iptables(const std::vector<std::string> &args)
        {
            if (iptables_unavailable)
            {
                return result(4, "iptables v1.8.9 (nf_tables): Could not fetch rule set generation id: Permission denied (you must be root)\n");
            }
            // -t TABLE OP CHAIN ARGS...
            if (args.size() < 4 || args[0] != "-t")
            {
                return result(2, "iptables: unsupported invocation");
            }

            infrastructure::NatRule rule;
            rule.table = args[1];
            rule.chain = args[3];
            rule.arguments.assign(args.begin() + 4, args.end());
            const auto &op = args[2];

            auto match = std::find(firewall.begin(), firewall.end(), rule);
            if (op == "-C")
            {
                return match != firewall.end()
                           ? result(0)
                           : result(1, "iptables: Bad rule (does a matching rule exist in that chain?).\n");
            }
            if (op == "-A")
            {
                firewall.push_back(rule);
                return result(0);
            }
            if (op == "-D")
            {
                if (match == firewall.end())
                {
                    return result(1, "iptables: Bad rule (does a matching rule exist in that chain?).\n");
                }
                firewall.erase(match);
                return result(0);
            }
            return result(2, "iptables: unknown operation " + op);
        }

        core::CommandResult FakeSystem::run_daemon(const std::string &comm, const std::vector<std::string> &args)
        {
            std::string pid_file;
            std::string conf;

            for (size_t i = 0; i < args.size(); ++i)
            {
                if (args[i] == "-P" && i + 1 < args.size())
                {
                    pid_file = args[++i];
                }
                else if (args[i] == "-C" && i + 1 < args.size())
                {
                    conf = args[++i];
                }
                else if (args[i].rfind("--pid-file=", 0) == 0)
                {
                    pid_file = args[i].substr(11);
                }
                else if (args[i] != "-B")
                {
                    conf = args[i];
                }
            }

            if (!file_exists(conf))
            {
                return result(1, "Could not open configuration file '" + conf + "' for reading.\n");
            }

            const auto pid = spawn(comm);
            if (daemons_write_pid_files && !pid_file.empty())
            {
                write_file(pid_file, std::to_string(pid) + "\n");
            }
            return result(0);
        }

        bool FakeSystem::is_alive(pid_t pid) const
        {
            return processes.count(pid) > 0;
        }

        bool FakeSystem::send_signal(pid_t pid, int signal)
        {
            if (!is_alive(pid))
            {
                return false;
            }
            if (signal == SIGTERM && daemons_ignore_sigterm)
            {
                return true;
            }
            if (signal == SIGTERM || signal == SIGKILL)
            {
                processes.erase(pid);
            }
            return true;
        }

        std::string FakeSystem::process_name(pid_t pid) const
        {
            auto it = processes.find(pid);
            return it == processes.end() ? "" : it->second;
        }

        void FakeSystem::add_interface(const std::string &name)
        {
            interfaces[name] = Interface{};
        }

        void FakeSystem::unplug(const std::string &name)
        {
            interfaces.erase(name);
        }

        void FakeSystem::fail_command(const std::string &prefix, int exit_code, const std::string &output)
        {
            failures_[prefix] = Failure{exit_code, output};
        }

        pid_t FakeSystem::spawn(const std::string &comm)
        {
            const pid_t pid = next_pid_++;
            processes[pid] = comm;
            return pid;
        }

        pid_t FakeSystem::live_pid(const std::string &comm) const
        {
            for (const auto &[pid, name] : processes)
            {
                if (name == comm)
                {
                    return pid;
                }
            }
            return 0;
        }

        size_t FakeSystem::rule_count(const infrastructure::NatRule &rule) const
        {
            return static_cast<size_t>(std::count(firewall.begin(), firewall.end(), rule));
        }

        size_t FakeSystem::ran(const std::string &prefix) const
        {
            size_t count = 0;
            for (const auto &argv : history)
            {
                if (core::format_command(argv).compare(0, prefix.size(), prefix) == 0)
                {
                    ++count;
                }
            }
            return count;
        }

        std::shared_ptr<core::HotspotConfig> make_config(const TempDir &dir,
                                                         const std::string &interface,
                                                         const std::string &upstream,
                                                         const std::string &subnet)
        {
            auto config = std::make_shared<core::HotspotConfig>(interface, upstream);
            config->network.subnet = subnet;

            config->paths.config_dir = dir.path();
            config->paths.hostapd_conf.clear();
            config->paths.dnsmasq_conf.clear();
            config->apply_path_defaults();
            config->paths.hostapd_pid_file = dir.file("nextu-hostapd.pid");
            config->paths.dnsmasq_pid_file = dir.file("nextu-dnsmasq.pid");
            config->paths.lock_file = dir.file("nextu-hotspot.lock");
            config->paths.lease_file = dir.file("dnsmasq.leases");

            config->supervision.start_attempts = 3;
            config->supervision.poll_interval_ms = 1;
            config->supervision.stop_timeout_ms = 20;
            config->supervision.settle_delay_ms = 0;
            config->supervision.restart_delay_ms = 0;

            return config;
        }

        void write_daemon_configs(const std::shared_ptr<const core::HotspotConfig> &config)
        {
            infrastructure::DaemonConfigWriter(config).write_all();
        }

        void write_file(const std::string &path, const std::string &content)
        {
            std::ofstream out(path, std::ios::trunc);
            out << content;
        }

        bool file_exists(const std::string &path)
        {
            std::error_code ec;
            return !path.empty() && std::filesystem::exists(path, ec);
        }

    } // namespace test
} // namespace nextu
