#include "network_observer.hpp"
#include "../logger/Mylogger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace network
{
    namespace
    {
        bool hasPrefix(const std::string &name, const std::string &prefix)
        {
            return name.compare(0, prefix.size(), prefix) == 0;
        }

        std::string readFirstLine(const fs::path &path)
        {
            std::ifstream file(path);
            std::string line;
            if (file.is_open())
                std::getline(file, line);
            return line;
        }

        // Wifi beats ethernet beats cellular when several links are up.
        int preference(models::NetworkTransport transport)
        {
            switch (transport)
            {
            case models::NetworkTransport::Wifi:
                return 3;
            case models::NetworkTransport::Ethernet:
                return 2;
            case models::NetworkTransport::Cellular:
                return 1;
            case models::NetworkTransport::None:
                return 0;
            }
            return 0;
        }
    }

    SysfsNetworkObserver::SysfsNetworkObserver(const std::string &sysfs_root)
        : sysfs_root_(sysfs_root) {}

    models::NetworkTransport SysfsNetworkObserver::classifyInterface(const std::string &name, bool has_wireless_dir)
    {
        if (name == "lo")
            return models::NetworkTransport::None;
        if (has_wireless_dir || hasPrefix(name, "wlan") || hasPrefix(name, "wlp"))
            return models::NetworkTransport::Wifi;
        if (hasPrefix(name, "wwan") || hasPrefix(name, "rmnet") || hasPrefix(name, "ppp"))
            return models::NetworkTransport::Cellular;
        return models::NetworkTransport::Ethernet;
    }

    models::NetworkState SysfsNetworkObserver::getCurrentState()
    {
        models::NetworkState state;
        std::error_code ec;
        fs::directory_iterator it(sysfs_root_, ec);
        if (ec)
        {
            MyLogger::warning("Network >> cannot list " + sysfs_root_ + ": " + ec.message());
            return state;
        }

        for (const auto &entry : it)
        {
            const std::string name = entry.path().filename().string();
            auto transport = classifyInterface(name, fs::exists(entry.path() / "wireless"));
            if (transport == models::NetworkTransport::None)
                continue;
            if (readFirstLine(entry.path() / "operstate") != "up")
                continue;
            state.connected = true;
            if (preference(transport) > preference(state.transport))
                state.transport = transport;
        }
        MyLogger::debug("Network >> connected=" + std::string(state.connected ? "true" : "false") +
                        " transport=" + models::toString(state.transport));
        return state;
    }
} // namespace network
