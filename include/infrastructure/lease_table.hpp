#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_LEASE_TABLE_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_LEASE_TABLE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace nextu
{
    namespace infrastructure
    {

        /**
         * One dnsmasq lease record, read-only
         */
        struct ClientLease
        {
            int64_t expiry = 0; // unix seconds, 0 for infinite leases
            std::string mac;
            std::string address;
            std::string hostname; // empty when the client sent none
            std::string client_id;
        };

        /**
         * Reader for the dnsmasq lease file:
         * "<expiry> <mac> <ip> <hostname|*> <client-id|*>" per line
         */
        class LeaseTable
        {
        public:
            explicit LeaseTable(const std::string &lease_file);

            /**
             * @param subnet Keep only leases inside "<subnet>.", all when empty
             * @throws core::HotspotError LeaseTableUnavailable when the file cannot be read
             */
            std::vector<ClientLease> read(const std::string &subnet = "") const;

            static std::vector<ClientLease> parse(const std::string &content, const std::string &subnet = "");

            const std::string &path() const { return lease_file_; }

        private:
            std::string lease_file_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_LEASE_TABLE_HPP
