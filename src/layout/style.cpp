#include <trellis/layout/style.h>

namespace trellis::layout {

bool is_align_start(Align a) {
    return a == Align::Left || a == Align::Top || a == Align::FlexStart || a == Align::TextTop;
}

bool is_align_middle(Align a) {
    return a == Align::Center || a == Align::Middle;
}

bool is_align_end(Align a) {
    return a == Align::Right || a == Align::Bottom || a == Align::FlexEnd || a == Align::TextBottom;
}

const char* align_name(Align a) {
    switch (a) {
        case Align::Left:        return "left";
        case Align::Top:         return "top";
        case Align::Center:      return "center";
        case Align::Middle:      return "middle";
        case Align::Right:       return "right";
        case Align::Bottom:      return "bottom";
        case Align::Baseline:    return "baseline";
        case Align::Justify:     return "justify";
        case Align::SpaceAround: return "space-around";
        case Align::FlexStart:   return "flex-start";
        case Align::FlexEnd:     return "flex-end";
        case Align::TextTop:     return "text-top";
        case Align::TextBottom:  return "text-bottom";
        case Align::Sub:         return "sub";
        case Align::Super:       return "super";
    }
    return "unknown";
}

const char* overflow_name(Overflow o) {
    switch (o) {
        case Overflow::Auto:    return "auto";
        case Overflow::Scroll:  return "scroll";
        case Overflow::Visible: return "visible";
        case Overflow::Hidden:  return "hidden";
    }
    return "unknown";
}

LayoutStyle frame_style() {
    LayoutStyle style;
    style.margin.set_all(2.0f);
    style.border.set_all(2.0f);
    style.padding.set_all(2.0f);
    return style;
}

// Infinitely stretchy spacer; width/height set its share among stretchers
LayoutStyle stretch_style() {
    LayoutStyle style;
    style.max_width = -1.0f;
    style.max_height = -1.0f;
    return style;
}

// Fixed blank space, one line square by default
LayoutStyle space_style(float line_height) {
    LayoutStyle style;
    style.width = line_height;
    style.height = line_height;
    style.line_height = line_height;
    return style;
}

LayoutStyle split_view_style() {
    LayoutStyle style;
    style.max_width = -1.0f;
    style.max_height = -1.0f;
    return style;
}

} // namespace trellis::layout
