#include "resolver.hpp"

#include <algorithm>
#include <format>
#include <ostream>
#include "debug.hpp"
#include "errors.hpp"

namespace dynargs
{

namespace
{
TypeDescriptor::Kind kindOf(MetaType::Shape shape)
{
    switch (shape)
    {
    case MetaType::Shape::optional:   return TypeDescriptor::Kind::optional;
    case MetaType::Shape::sequence:   return TypeDescriptor::Kind::sequence;
    case MetaType::Shape::fixedTuple: return TypeDescriptor::Kind::fixedTuple;
    case MetaType::Shape::mapping:    return TypeDescriptor::Kind::mapping;
    case MetaType::Shape::literal:    return TypeDescriptor::Kind::literal;
    case MetaType::Shape::record:     return TypeDescriptor::Kind::nestedStruct;
    case MetaType::Shape::variant:    return TypeDescriptor::Kind::union_;
    case MetaType::Shape::primitive:
    case MetaType::Shape::annotated:
        break;
    }

    return TypeDescriptor::Kind::primitive;
}

bool sameDescriptor(TypeDescriptorPtr const& a, TypeDescriptorPtr const& b)
{
    if (a == b)
        return true;

    if (a == nullptr || b == nullptr)
        return false;

    return *a == *b;
}

std::string prettyName(MetaType const& meta)
{
    return detail::demangle(meta.typeInfo().name());
}
} // namespace

//=============================================================================
bool TypeDescriptor::isChoice() const
{
    return kind == Kind::union_ && (! children.empty())
        && std::all_of(children.begin(), children.end(),
                       [] (TypeDescriptorPtr const& c) { return c->kind == Kind::nestedStruct; });
}

std::string TypeDescriptor::name() const
{
    return meta != nullptr ? meta->name() : std::string("<unresolved>");
}

bool operator==(TypeDescriptor const& a, TypeDescriptor const& b)
{
    auto sameMember = [] (TypeDescriptor::Member const& x, TypeDescriptor::Member const& y)
    {
        return x.name == y.name && x.fieldname == y.fieldname
            && x.annotations == y.annotations && sameDescriptor(x.type, y.type);
    };

    return a.kind == b.kind && a.meta == b.meta && a.source == b.source
        && a.choices == b.choices && a.annotations == b.annotations && a.bindings == b.bindings
        && std::ranges::equal(a.children, b.children, sameDescriptor)
        && std::ranges::equal(a.members, b.members, sameMember);
}

std::ostream& operator<<(std::ostream& o, TypeDescriptor::Kind kind)
{
    switch (kind)
    {
    case TypeDescriptor::Kind::primitive:    return o << "primitive";
    case TypeDescriptor::Kind::optional:     return o << "optional";
    case TypeDescriptor::Kind::sequence:     return o << "sequence";
    case TypeDescriptor::Kind::fixedTuple:   return o << "fixed tuple";
    case TypeDescriptor::Kind::mapping:      return o << "mapping";
    case TypeDescriptor::Kind::literal:      return o << "literal";
    case TypeDescriptor::Kind::nestedStruct: return o << "nested struct";
    case TypeDescriptor::Kind::union_:       return o << "union";
    }

    return o;
}

//=============================================================================
TypeDescriptorPtr Resolver::resolve(MetaType const& raw)
{
    MetaType const* meta = &raw;
    Annotations collected;

    // outer markers win over inner ones
    while (meta->shape() == MetaType::Shape::annotated)
    {
        auto level = meta->annotations();
        level.merge(collected);
        collected = std::move(level);
        meta = &meta->elementTypes().front()();
    }

    std::shared_ptr<TypeDescriptor> desc;

    if (meta->shape() == MetaType::Shape::record)
    {
        desc = resolveRecord(*meta);
    }
    else
    {
        desc = std::make_shared<TypeDescriptor>();
        desc->kind = kindOf(meta->shape());
        desc->meta = meta;
        desc->choices = meta->choices();

        for (auto getter : meta->elementTypes())
            desc->children.push_back(resolve(getter()));

        if (desc->kind == TypeDescriptor::Kind::union_)
            classifyUnion(*desc);
    }

    desc->source = &raw;
    desc->annotations = std::move(collected);
    return desc;
}

TypeDescriptorPtr Resolver::resolve(TypeDescriptor const& descriptor)
{
    if (descriptor.source == nullptr)
        throw InternalError("cannot re-resolve a descriptor without a source type");

    return resolve(*descriptor.source);
}

std::shared_ptr<TypeDescriptor> Resolver::resolveRecord(MetaType const& meta)
{
    auto desc = std::make_shared<TypeDescriptor>();
    desc->kind = TypeDescriptor::Kind::nestedStruct;
    desc->meta = &meta;

    std::vector<std::type_index> bindingKey;

    for (auto getter : meta.templateArguments())
    {
        desc->bindings.push_back(&getter());
        bindingKey.emplace_back(getter().typeInfo());
    }

    std::type_index const type(meta.typeInfo());

    auto it = std::find_if(active.begin(), active.end(), [&] (ActiveRecord const& r)
    {
        return r.type == type && r.bindings == bindingKey;
    });

    if (it != active.end())
    {
        std::string chain;

        for (; it != active.end(); ++it)
            chain += it->name + " -> ";

        throw CyclicTypeError(std::format("recursive type cannot be expressed as a command line: {}{}",
                                          chain, prettyName(meta)));
    }

    active.push_back({ type, std::move(bindingKey), prettyName(meta) });
    auto const popOnExit = detail::callAtEndOfScope([this] { active.pop_back(); });

    DYNARGS_DEBUG_L2("Resolver: record {} with {} fields", prettyName(meta), meta.fields().size());

    for (auto const& field : meta.fields())
    {
        auto type = resolve(field.metaType());

        auto annotations = field.annotations();
        annotations.merge(type->annotations);

        std::string fieldname(field.fieldname);
        auto name = annotations.name.value_or(fieldname);

        desc->members.push_back({ std::move(name), std::move(fieldname), std::move(type), std::move(annotations) });
    }

    return desc;
}

void Resolver::classifyUnion(TypeDescriptor const& desc) const
{
    auto const records = std::count_if(desc.children.begin(), desc.children.end(),
                                       [] (TypeDescriptorPtr const& c) { return c->kind == TypeDescriptor::Kind::nestedStruct; });

    if (records == 0 || static_cast<std::size_t>(records) == desc.children.size())
        return;

    throw UnsupportedUnionShapeError(std::format("{} mixes records with other alternatives; "
                                                 "use either only records (subcommands) or no records at all",
                                                 prettyName(*desc.meta)));
}
} // namespace dynargs
