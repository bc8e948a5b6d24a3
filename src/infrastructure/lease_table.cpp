#include "infrastructure/lease_table.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <sstream>

namespace nextu
{
    namespace infrastructure
    {

        LeaseTable::LeaseTable(const std::string &lease_file)
            : lease_file_(lease_file)
        {
        }

        std::vector<ClientLease> LeaseTable::read(const std::string &subnet) const
        {
            std::ifstream file(lease_file_);
            if (!file.is_open())
            {
                throw core::HotspotError(core::ErrorCode::LeaseTableUnavailable, "lease table",
                                         "read " + lease_file_, "cannot open lease file");
            }

            std::stringstream content;
            content << file.rdbuf();
            return parse(content.str(), subnet);
        }

        std::vector<ClientLease> LeaseTable::parse(const std::string &content, const std::string &subnet)
        {
            std::vector<ClientLease> leases;
            const std::string prefix = subnet.empty() ? "" : subnet + ".";

            std::istringstream lines(content);
            std::string line;
            while (std::getline(lines, line))
            {
                std::istringstream fields(line);
                std::string expiry;
                ClientLease lease;
                if (!(fields >> expiry >> lease.mac >> lease.address))
                {
                    continue; // blank or truncated record
                }

                try
                {
                    lease.expiry = std::stoll(expiry);
                }
                catch (const std::exception &)
                {
                    continue;
                }

                // The lease file may be shared with other dnsmasq instances
                if (!prefix.empty() && lease.address.compare(0, prefix.size(), prefix) != 0)
                {
                    continue;
                }

                fields >> lease.hostname >> lease.client_id;
                if (lease.hostname == "*")
                {
                    lease.hostname.clear();
                }
                if (lease.client_id == "*")
                {
                    lease.client_id.clear();
                }
                leases.push_back(lease);
            }
            return leases;
        }

    } // namespace infrastructure
} // namespace nextu
