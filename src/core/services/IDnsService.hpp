/**
 * @file IDnsService.hpp
 * @brief Interface for reading and changing the system DNS configuration.
 */

#pragma once

#include "core/types/DnsTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nettune::core {

/**
 * @brief Reads and writes DNS servers of the active network adapter.
 *
 * All calls block while the underlying system commands run and must not be
 * made from the UI thread.
 */
class IDnsService {
public:
    virtual ~IDnsService() = default;

    /**
     * @brief Finds the adapter carrying the default connection.
     * @return Adapter name, or std::nullopt if none is connected.
     */
    virtual std::optional<std::string> activeAdapter() = 0;

    /**
     * @brief Lists the DNS servers configured on an adapter, in order.
     */
    virtual std::vector<std::string> currentDns(const std::string& adapter) = 0;

    /**
     * @brief Sets static primary and secondary DNS servers.
     * @return Success message, or an error carrying the command's error output.
     */
    virtual OperationResult setDns(const std::string& adapter, const std::string& primary,
                                   const std::string& secondary) = 0;

    /**
     * @brief Resets the adapter's DNS configuration to DHCP.
     */
    virtual OperationResult clearDns(const std::string& adapter) = 0;
};

} // namespace nettune::core
