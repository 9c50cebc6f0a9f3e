#ifndef SHUTTLE_TRANSPORT_FACTORY_HPP_
#define SHUTTLE_TRANSPORT_FACTORY_HPP_

#include <functional>
#include <map>
#include <string>

#include <shuttle/transport.hpp>

// Name to transport registry, "curl" is always present.
// Registration is meant for start-up, it is not synchronized.
class TransportFactory {
public:
    using CreatorFunc = std::function<TransportPtr()>;

    // nullptr for unknown names
    static auto create(std::string const& name) -> TransportPtr;

    static void registerCreator(std::string const& name, CreatorFunc creator);

private:
    static TransportFactory& instance();

    std::map<std::string, CreatorFunc> registry_;

    TransportFactory();
};

#endif  // SHUTTLE_TRANSPORT_FACTORY_HPP_
