#ifndef TUNNEL_H
#define TUNNEL_H

#include <string>
#include <vector>
#include <cstdint>

enum class ForwardType {
    Local,
    Remote,
    Dynamic
};

// LocalForward <local_port> <remote_host>:<remote_port>
struct PortForward {
    uint16_t local_port;
    std::string remote_host;
    uint16_t remote_port;

    PortForward() : local_port(0), remote_port(0) {}
    PortForward(uint16_t local, const std::string& host, uint16_t remote)
        : local_port(local), remote_host(host), remote_port(remote) {}

    std::string to_string() const {
        return std::to_string(local_port) + ":" + remote_host + ":" + std::to_string(remote_port);
    }
};

// RemoteForward <bind_port> <remote_host>:<remote_port>
struct RemotePortForward {
    uint16_t bind_port;
    std::string remote_host;
    uint16_t remote_port;

    RemotePortForward() : bind_port(0), remote_port(0) {}
    RemotePortForward(uint16_t bind, const std::string& host, uint16_t remote)
        : bind_port(bind), remote_host(host), remote_port(remote) {}

    std::string to_string() const {
        return "R:" + std::to_string(bind_port) + "\xE2\x86\x92" + remote_host + ":" + std::to_string(remote_port);
    }
};

// DynamicForward [bind_address:]<listen_port> (SOCKS)
struct DynamicForward {
    uint16_t listen_port;

    DynamicForward() : listen_port(0) {}
    explicit DynamicForward(uint16_t port) : listen_port(port) {}

    std::string to_string() const {
        return "D:" + std::to_string(listen_port);
    }
};

// A Host block with at least one forward of any kind
struct TunnelHost {
    std::string name;
    std::string hostname; // empty if the block has no HostName
    std::string group;    // empty if untagged
    std::vector<PortForward> forwards;
    std::vector<RemotePortForward> remote_forwards;
    std::vector<DynamicForward> dynamic_forwards;

    bool has_forwards() const {
        return !forwards.empty() || !remote_forwards.empty() || !dynamic_forwards.empty();
    }

    bool operator==(const TunnelHost& other) const {
        return name == other.name;
    }
};

#endif // TUNNEL_H
