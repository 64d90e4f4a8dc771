#pragma once
/**
 * @file view.hpp
 * @brief Read-only view of a routing resource, the only input annotation parsers see.
 */

#include <span>
#include <string_view>

#include "ngsynth/model/resource.hpp"

namespace ngsynth::annotations {

/** @class ResourceView
 *  @brief Namespace, name, raw annotations and rules of one resource.
 */
class ResourceView {
public:
    virtual ~ResourceView() = default;
    virtual std::string_view namespace_name() const noexcept = 0;
    virtual std::string_view name() const noexcept = 0;
    virtual const model::AnnotationMap& annotations() const noexcept = 0;
    virtual std::span<const model::Rule> rules() const noexcept = 0;
};

/// View over a model::RoutingResource; the resource must outlive the view.
class RoutingResourceView final : public ResourceView {
public:
    explicit RoutingResourceView(const model::RoutingResource& res) noexcept : res_(res) {}

    std::string_view namespace_name() const noexcept override { return res_.namespace_name; }
    std::string_view name() const noexcept override { return res_.name; }
    const model::AnnotationMap& annotations() const noexcept override { return res_.annotations; }
    std::span<const model::Rule> rules() const noexcept override { return res_.rules; }

private:
    const model::RoutingResource& res_;
};

} // namespace ngsynth::annotations
