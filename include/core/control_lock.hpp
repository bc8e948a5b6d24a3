#ifndef NEXTU_HOTSPOT_CORE_CONTROL_LOCK_HPP
#define NEXTU_HOTSPOT_CORE_CONTROL_LOCK_HPP

#include <string>

namespace nextu
{
    namespace core
    {

        /**
         * Advisory, non-blocking, system-wide lock held for the duration of
         * one start/stop/restart. Contention throws HotspotError(AlreadyInProgress).
         * Released when the object is destroyed.
         */
        class ControlLock
        {
        public:
            explicit ControlLock(const std::string &lock_path);
            ~ControlLock();

            ControlLock(const ControlLock &) = delete;
            ControlLock &operator=(const ControlLock &) = delete;

            const std::string &path() const { return path_; }

        private:
            std::string path_;
            int fd_ = -1;
        };

    } // namespace core
} // namespace nextu

#endif // NEXTU_HOTSPOT_CORE_CONTROL_LOCK_HPP
