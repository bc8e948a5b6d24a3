#include "core/control_lock.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace nextu
{
    namespace core
    {

        ControlLock::ControlLock(const std::string &lock_path)
            : path_(lock_path)
        {
            fd_ = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
            if (fd_ < 0)
            {
                throw HotspotError(ErrorCode::CommandFailed, "control lock",
                                   "open " + path_, std::string("cannot open lock file: ") + strerror(errno));
            }

            if (flock(fd_, LOCK_EX | LOCK_NB) != 0)
            {
                const int lock_errno = errno;
                close(fd_);
                fd_ = -1;
                if (lock_errno == EWOULDBLOCK)
                {
                    throw HotspotError(ErrorCode::AlreadyInProgress, "control lock", "flock " + path_,
                                       "another start/stop/restart is in progress");
                }
                throw HotspotError(ErrorCode::CommandFailed, "control lock", "flock " + path_,
                                   std::string("cannot lock: ") + strerror(lock_errno));
            }

            get_logger("ControlLock")->debug("Control lock acquired", LogContext().add("path", path_));
        }

        ControlLock::~ControlLock()
        {
            if (fd_ >= 0)
            {
                flock(fd_, LOCK_UN);
                close(fd_);
            }
        }

    } // namespace core
} // namespace nextu
