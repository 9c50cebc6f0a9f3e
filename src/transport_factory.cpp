#include <shuttle/transport_factory.hpp>

#include <shuttle/curl_transport.hpp>

TransportFactory& TransportFactory::instance()
{
    static TransportFactory instance;
    return instance;
}

TransportFactory::TransportFactory()
{
    registry_["curl"] = CurlTransport::create;
}

auto TransportFactory::create(std::string const& name) -> TransportPtr
{
    auto& registry = TransportFactory::instance().registry_;

    if (auto const iter = registry.find(name); iter != std::end(registry)) {
        return iter->second();
    }
    return nullptr;
}

void TransportFactory::registerCreator(std::string const& name, CreatorFunc creator)
{
    TransportFactory::instance().registry_[name] = std::move(creator);
}
