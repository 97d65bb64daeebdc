#ifndef NETWORK_OBSERVER_HPP
#define NETWORK_OBSERVER_HPP

#include <string>
#include "../models/models.hpp"

namespace network
{
    // Reports connectivity on demand. Polled by the gating logic; nothing
    // in the core subscribes to it.
    class NetworkObserver
    {
    public:
        virtual ~NetworkObserver() = default;
        virtual models::NetworkState getCurrentState() = 0;
    };

    // Reads interface state from /sys/class/net (Linux).
    class SysfsNetworkObserver : public NetworkObserver
    {
    public:
        explicit SysfsNetworkObserver(const std::string &sysfs_root = "/sys/class/net");

        models::NetworkState getCurrentState() override;

        // Exposed for tests: classifies one interface directory.
        static models::NetworkTransport classifyInterface(const std::string &name, bool has_wireless_dir);

    private:
        std::string sysfs_root_;
    };
} // namespace network

#endif // NETWORK_OBSERVER_HPP
