#pragma once

#include "session-configuration.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML
{

template <>
struct convert<httpauth::SessionConfiguration::Proxy>
{
    static Node encode(httpauth::SessionConfiguration::Proxy const& proxy);
    static bool decode(Node const& node, httpauth::SessionConfiguration::Proxy& proxy);
};

template <>
struct convert<httpauth::SessionConfiguration::Tls>
{
    static Node encode(httpauth::SessionConfiguration::Tls const& tls);
    static bool decode(Node const& node, httpauth::SessionConfiguration::Tls& tls);
};

/**
 * Reads the scheme-independent keys (headers, cookies, proxy, tls,
 * timeout, max-redirects, user-agent) of a settings entry.
 * Unknown keys are ignored, so the same node may carry credentials.
 */
template <>
struct convert<httpauth::SessionConfiguration>
{
    static Node encode(httpauth::SessionConfiguration const& config);
    static bool decode(Node const& node, httpauth::SessionConfiguration& config);
};

}
