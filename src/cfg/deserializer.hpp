#pragma once

#include "config_node.hpp"
#include <tuple>
#include <type_traits>
#include <utility>

namespace shortid::cfg {

template<typename T> T deserialize(const ConfigNode &);

// --------------------------------------------------------------------------------
// Field descriptor

template<typename Class, typename Field> struct FieldDesc {
    std::string name;
    Field Class::*ptr;
    FieldDesc(const std::string &n, Field Class::*p)
        : name(n), ptr(p)
    { }
};

template<typename Class, typename Field> FieldDesc<Class, Field> field(const std::string &name, Field Class::*ptr)
{
    return FieldDesc<Class, Field>(name, ptr);
}

template<typename T> struct is_deserializable_struct : std::false_type { };

// --------------------------------------------------------------------------------
// Deserializer implementation

template<typename T, typename... Fields> class Deserializer {
    std::tuple<Fields...> fields;

    template<std::size_t I> void deserializeOne(T &obj, const ConfigNode &node) const
    {
        const auto &fieldDesc = std::get<I>(fields);
        const ConfigNode *childNode = node.findChild(fieldDesc.name);
        if (!childNode)
            return;

        using FieldType = std::decay_t<decltype(obj.*fieldDesc.ptr)>;

        try {
            if constexpr (is_optional<FieldType>::value) {
                // an empty value leaves the option unset
                using Elem = typename FieldType::value_type;
                const auto first = childNode->value.find_first_not_of(" \t");
                if (first == std::string::npos)
                    obj.*(fieldDesc.ptr) = std::nullopt;
                else
                    obj.*(fieldDesc.ptr) = fromString<Elem>(childNode->value);
            } else {
                obj.*(fieldDesc.ptr) = fromString<FieldType>(childNode->value);
            }
        } catch (const std::runtime_error &e) {
            throw std::runtime_error(fmt::format("Section '{}', option '{}': {}", node.key, fieldDesc.name, e.what()));
        }
    }

    template<std::size_t... Is> void deserializeFields(T &obj, const ConfigNode &node, std::index_sequence<Is...>) const
    {
        (deserializeOne<Is>(obj, node), ...);
    }

public:
    Deserializer(Fields... f)
        : fields(f...)
    { }

    T operator()(const ConfigNode &node) const
    {
        T obj{};
        deserializeFields(obj, node, std::make_index_sequence<sizeof...(Fields)>{});

        // every section validates itself once all fields are in
        obj.validate();

        return obj;
    }
};

template<typename T, typename... FieldTs> auto make_deserializer(FieldTs... fields) -> Deserializer<T, FieldTs...>
{
    return Deserializer<T, FieldTs...>(fields...);
}

// --------------------------------------------------------------------------------
// Registration macro

#define SHORTID_REGISTER_STRUCT(Type, ...)                                                                             \
    template<> struct is_deserializable_struct<Type> : std::true_type { };                                             \
    template<> inline Type deserialize<Type>(const ConfigNode &node)                                                   \
    {                                                                                                                  \
        auto deserializer = make_deserializer<Type>(__VA_ARGS__);                                                      \
        return deserializer(node);                                                                                     \
    }

template<typename T> T parse(const ConfigNode &node)
{
    static_assert(is_deserializable_struct<T>::value, "Type not deserializable");
    return deserialize<T>(node);
}

} // namespace shortid::cfg
