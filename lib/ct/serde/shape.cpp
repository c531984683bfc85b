/* This file is part of CBOR Turbo project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <ct/serde/shape.hpp>

namespace cbor_turbo::serde {
    static shape with_fields(const shape_kind kind, std::string name, shape::field_list fields)
    {
        shape s { kind, std::move(name) };
        s.children.reserve(fields.size());
        s.names.reserve(fields.size());
        for (auto &&[f_name, f_shape]: fields) {
            s.names.emplace_back(std::move(f_name));
            s.children.emplace_back(std::move(f_shape));
        }
        return s;
    }

    shape shape::option(shape inner)
    {
        return shape { shape_kind::option, {}, { std::move(inner) } };
    }

    shape shape::unit_struct(std::string name)
    {
        return shape { shape_kind::unit_struct, std::move(name) };
    }

    shape shape::newtype_struct(std::string name, shape inner)
    {
        return shape { shape_kind::newtype_struct, std::move(name), { std::move(inner) } };
    }

    shape shape::seq(shape elem)
    {
        return shape { shape_kind::seq, {}, { std::move(elem) } };
    }

    shape shape::tuple(std::vector<shape> elems)
    {
        return shape { shape_kind::tuple, {}, std::move(elems) };
    }

    shape shape::tuple_struct(std::string name, std::vector<shape> elems)
    {
        return shape { shape_kind::tuple_struct, std::move(name), std::move(elems) };
    }

    shape shape::map(shape key, shape val)
    {
        return shape { shape_kind::map, {}, { std::move(key), std::move(val) } };
    }

    shape shape::record(std::string name, field_list fields)
    {
        return with_fields(shape_kind::record, std::move(name), std::move(fields));
    }

    shape shape::enumeration(std::string name, std::vector<shape> variants)
    {
        for (const auto &v: variants) {
            switch (v.kind) {
                case shape_kind::unit_variant:
                case shape_kind::newtype_variant:
                case shape_kind::tuple_variant:
                case shape_kind::struct_variant:
                    break;
                default:
                    throw error(fmt::format("enumeration {} can contain only variant shapes but got {}", name, v.kind));
            }
        }
        return shape { shape_kind::enumeration, std::move(name), std::move(variants) };
    }

    shape shape::unit_variant(std::string variant)
    {
        return shape { shape_kind::unit_variant, std::move(variant) };
    }

    shape shape::newtype_variant(std::string variant, shape inner)
    {
        return shape { shape_kind::newtype_variant, std::move(variant), { std::move(inner) } };
    }

    shape shape::tuple_variant(std::string variant, std::vector<shape> elems)
    {
        return shape { shape_kind::tuple_variant, std::move(variant), std::move(elems) };
    }

    shape shape::struct_variant(std::string variant, field_list fields)
    {
        return with_fields(shape_kind::struct_variant, std::move(variant), std::move(fields));
    }

    shape shape::tagged(shape inner)
    {
        return shape { shape_kind::tagged, {}, { std::move(inner) } };
    }

    shape shape::tag_required(const uint64_t tag, shape inner)
    {
        return shape { shape_kind::tag_required, {}, { std::move(inner) }, {}, tag };
    }

    shape shape::tag_accepted(const uint64_t tag, shape inner)
    {
        return shape { shape_kind::tag_accepted, {}, { std::move(inner) }, {}, tag };
    }

    const shape &shape::child(const size_t idx) const
    {
        if (idx < children.size()) [[likely]]
            return children[idx];
        throw error(fmt::format("a {} shape has {} children but child #{} was requested", kind, children.size(), idx));
    }
}
