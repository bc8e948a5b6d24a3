#include "core/command_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nextu
{
    namespace core
    {

        std::string format_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                {
                    cmd << " ";
                }
                if (argv[i].empty() || argv[i].find_first_of(" \t\"'") != std::string::npos)
                {
                    cmd << "'" << argv[i] << "'";
                }
                else
                {
                    cmd << argv[i];
                }
            }
            return cmd.str();
        }

        SystemCommandRunner::SystemCommandRunner()
            : logger_(get_logger("CommandRunner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &argv)
        {
            CommandResult result;
            if (argv.empty())
            {
                result.output = "empty command";
                return result;
            }

            logger_->debug("Running command", LogContext().add("command", format_command(argv)));

            int pipe_fds[2];
            if (pipe2(pipe_fds, O_CLOEXEC) != 0)
            {
                result.output = std::string("pipe failed: ") + strerror(errno);
                logger_->error("Failed to create output pipe", LogContext().add("error", strerror(errno)));
                return result;
            }

            pid_t pid = fork();
            const int fork_errno = errno;
            if (pid == 0)
            {
                // Child: stdout and stderr both feed the pipe
                dup2(pipe_fds[1], STDOUT_FILENO);
                dup2(pipe_fds[1], STDERR_FILENO);
                int dev_null = open("/dev/null", O_RDONLY);
                if (dev_null >= 0)
                {
                    dup2(dev_null, STDIN_FILENO);
                }

                std::vector<char *> args;
                for (const auto &arg : argv)
                {
                    args.push_back(const_cast<char *>(arg.c_str()));
                }
                args.push_back(nullptr);

                execvp(args[0], args.data());
                _exit(127); // exec failed
            }

            close(pipe_fds[1]);

            if (pid < 0)
            {
                close(pipe_fds[0]);
                result.output = std::string("fork failed: ") + strerror(fork_errno);
                logger_->error("Failed to fork command", LogContext().add("command", argv[0]).add("error", strerror(fork_errno)));
                return result;
            }

            char buffer[256];
            ssize_t count;
            while ((count = read(pipe_fds[0], buffer, sizeof(buffer))) != 0)
            {
                if (count < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    break;
                }
                result.output.append(buffer, static_cast<size_t>(count));
            }
            close(pipe_fds[0]);

            int status = 0;
            while (waitpid(pid, &status, 0) < 0)
            {
                if (errno != EINTR)
                {
                    result.output += std::string("waitpid failed: ") + strerror(errno);
                    return result;
                }
            }

            if (WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status))
            {
                result.exit_code = 128 + WTERMSIG(status);
            }

            if (result.exit_code == 127)
            {
                logger_->debug("Command not found or not executable", LogContext().add("command", argv[0]));
            }

            logger_->debug("Command finished",
                           LogContext().add("command", argv[0]).add("exit_code", result.exit_code));
            return result;
        }

    } // namespace core
} // namespace nextu
