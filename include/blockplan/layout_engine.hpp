#pragma once

#include "blockplan/config.hpp"
#include "blockplan/instance_expander.hpp"
#include "blockplan/layout_types.hpp"
#include "blockplan/rule_registry.hpp"

#include <string>
#include <vector>

namespace blockplan {

/// Turns a project request into a layout by building and solving one
/// optimization model. Each call owns its own Z3 context.
class LayoutEngine {
public:
    explicit LayoutEngine(const RuleRegistry& registry, LayoutOptions options = LayoutOptions());

    /// Never throws for bad input: configuration problems come back as
    /// LayoutStatus::ConfigurationError
    [[nodiscard]] LayoutResult solve(const ProjectRequest& request) const;

    [[nodiscard]] const LayoutOptions& options() const noexcept { return options_; }
    [[nodiscard]] const RuleRegistry& registry() const noexcept { return registry_; }

private:
    void validate_request(const ProjectRequest& request, const InstanceSet& instances) const;

    const RuleRegistry& registry_;
    LayoutOptions options_;
};

} // namespace blockplan
