#include "core/process_control.hpp"

#include <cerrno>
#include <fstream>
#include <signal.h>

namespace nextu
{
    namespace core
    {

        bool SystemProcessControl::is_alive(pid_t pid) const
        {
            if (pid <= 0)
            {
                return false;
            }
            // EPERM still means the pid exists
            return kill(pid, 0) == 0 || errno == EPERM;
        }

        bool SystemProcessControl::send_signal(pid_t pid, int signal)
        {
            if (pid <= 0)
            {
                return false;
            }
            return kill(pid, signal) == 0;
        }

        std::string SystemProcessControl::process_name(pid_t pid) const
        {
            std::ifstream comm("/proc/" + std::to_string(pid) + "/comm");
            std::string name;
            if (comm && std::getline(comm, name))
            {
                return name;
            }
            return "";
        }

    } // namespace core
} // namespace nextu
