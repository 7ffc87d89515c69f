#include <trellis/layout/layout_node.h>

#include <stdexcept>
#include <utility>

namespace trellis::layout {

const char* layout_mode_name(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::Widget:  return "widget";
        case LayoutMode::Row:     return "row";
        case LayoutMode::Column:  return "column";
        case LayoutMode::Grid:    return "grid";
        case LayoutMode::Stacked: return "stacked";
        case LayoutMode::Split:   return "split";
    }
    return "unknown";
}

LayoutNode* LayoutNode::append_child(std::unique_ptr<LayoutNode> child) {
    auto* raw = child.get();
    if (raw) raw->parent = this;
    children.push_back(std::move(child));
    return raw;
}

LayoutNode* LayoutNode::child_at(std::size_t idx) const {
    if (idx >= children.size()) {
        throw std::invalid_argument("child index " + std::to_string(idx) +
                                    " out of range for " + std::to_string(children.size()) +
                                    " children of '" + name + "'");
    }
    return children[idx].get();
}

void LayoutNode::show_child_at_index(std::size_t idx) {
    child_at(idx);  // validates
    stack_top = idx;
}

std::vector<LayoutNode*> LayoutNode::visible_children() const {
    std::vector<LayoutNode*> out;
    if (mode == LayoutMode::Stacked) {
        if (stack_top && *stack_top < children.size() && children[*stack_top]) {
            out.push_back(children[*stack_top].get());
        }
        return out;
    }
    for (const auto& child : children) {
        if (child) out.push_back(child.get());
    }
    return out;
}

std::string LayoutNode::path() const {
    std::string out;
    for (const LayoutNode* n = this; n != nullptr; n = n->parent) {
        out.insert(0, "/" + (n->name.empty() ? std::string(layout_mode_name(n->mode)) : n->name));
    }
    return out;
}

} // namespace trellis::layout
