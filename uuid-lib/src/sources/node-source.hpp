#ifndef NODE_SOURCE_HPP
#define NODE_SOURCE_HPP
#include "random-source.hpp"
#include <uuid/uuid.hpp>
#include <string>

namespace UUID{
    // Supplies the 48-bit node field of version 1 uuids.
    // Implementations must fail with errc::node_id_unavailable instead of
    // inventing a value.
    class NodeSource
    {
    public:
        virtual Node get_node_id(std::error_code& ec) = 0;
        virtual ~NodeSource() = default;
    };

    // Hardware address of a network interface, found with getifaddrs(3).
    // With no interface name the first interface that has a non-zero,
    // non-multicast address is used. Loopback is skipped.
    class InterfaceNodeSource: public NodeSource
    {
    public:
        InterfaceNodeSource() = default;
        explicit InterfaceNodeSource(const std::string& interface): interface_(interface) {}
        Node get_node_id(std::error_code& ec) override;

        const std::string& interface() const { return interface_; }
    private:
        std::string interface_;
    };

    // A caller supplied node id.
    class StaticNodeSource: public NodeSource
    {
    public:
        explicit StaticNodeSource(const Node& node): node_(node) {}
        Node get_node_id(std::error_code& ec) override { ec.clear(); return node_; }
    private:
        Node node_;
    };

    // RFC 4122 section 4.5: 47 random bits with the multicast bit set.
    // This is the explicit fallback for hosts without a usable hardware address.
    // The value is drawn once and reused for the life of the source.
    class RandomNodeSource: public NodeSource
    {
    public:
        explicit RandomNodeSource(RandomSource& rng): rng_(rng), node_{}, drawn_{false} {}
        Node get_node_id(std::error_code& ec) override;
    private:
        RandomSource& rng_;
        Node node_;
        bool drawn_;
    };
}// UUID namespace
#endif
