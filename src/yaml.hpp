#ifndef YAML_HPP
#define YAML_HPP

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

struct bgp_neighbour_v4;
struct global_conf;
enum class LOGL: uint8_t;

namespace YAML {
    template <>
    struct convert<bgp_neighbour_v4>
    {
        static Node encode(const bgp_neighbour_v4 &rhs);
        static bool decode(const Node &node, bgp_neighbour_v4 &rhs);
    };

    template <>
    struct convert<global_conf>
    {
        static Node encode(const global_conf &rhs);
        static bool decode(const Node &node, global_conf &rhs);
    };

    template <>
    struct convert<LOGL>
    {
        static Node encode(const LOGL &rhs);
        static bool decode(const Node &node, LOGL &rhs);
    };
}

// Parses and validates a configuration file, throws on any error
global_conf load_config( const std::string &path );

#endif
