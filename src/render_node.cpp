// =============================================================================
//  BarPlotOpenCV - Bar series rendering on OpenCV
//  Copyright (c) 2025 Michael Hannan
//
//  This file is part of BarPlotOpenCV and is licensed under the BSD 3-Clause
//  License. See the LICENSE file in the project root for full terms.
// =============================================================================

#include "render_node.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace bpocv
{

    /* --------------------------------------------------------------------------
     *  RenderNode
     * ------------------------------------------------------------------------*/
    bool RenderNode::has_class(const std::string& token) const
    {
        return std::find(classes.begin(), classes.end(), token) != classes.end();
    }

    void RenderNode::add_class(const std::string& token)
    {
        if (!token.empty() && !has_class(token)) classes.push_back(token);
    }

    void RenderNode::set_class(const std::string& class_attr)
    {
        classes = split_classes(class_attr);
    }

    std::string RenderNode::class_attr() const
    {
        std::string out;
        for (const auto& c : classes)
        {
            if (!out.empty()) out += ' ';
            out += c;
        }
        return out;
    }

    bool RenderNode::has_attr(const std::string& key) const
    {
        return attrs.find(key) != attrs.end();
    }

    std::string RenderNode::attr(const std::string& key) const
    {
        const auto it = attrs.find(key);
        return it == attrs.end() ? std::string() : it->second;
    }

    void RenderNode::set_attr(const std::string& key, double value)
    {
        attrs[key] = format_number(value);
    }

    double RenderNode::num_attr(const std::string& key, double fallback) const
    {
        const auto it = attrs.find(key);
        if (it == attrs.end() || it->second.empty()) return fallback;
        char* end = nullptr;
        const double v = std::strtod(it->second.c_str(), &end);
        if (end == it->second.c_str() || *end != '\0') return fallback;
        return v;
    }

    /* --------------------------------------------------------------------------
     *  Free helpers
     * ------------------------------------------------------------------------*/
    RenderNode make_node(NodeType type, const std::string& tag, const std::string& class_attr)
    {
        RenderNode n;
        n.type = type;
        n.tag = tag;
        n.classes = split_classes(class_attr);
        return n;
    }

    RenderNode make_group(const std::string& class_attr)
    {
        return make_node(NodeType::Group, "g", class_attr);
    }

    std::string format_number(double v)
    {
        if (!std::isfinite(v)) return std::isnan(v) ? "NaN" : (v > 0 ? "Infinity" : "-Infinity");
        if (v == 0.0) return "0";  // also folds -0
        if (std::floor(v) == v && std::abs(v) < 1e15)
        {
            std::ostringstream ss;
            ss << static_cast<long long>(v);
            return ss.str();
        }
        std::ostringstream ss;
        ss << std::setprecision(10) << v;
        return ss.str();
    }

    std::vector<std::string> split_classes(const std::string& class_attr)
    {
        std::vector<std::string> out;
        std::istringstream ss(class_attr);
        std::string tok;
        while (ss >> tok)
        {
            if (std::find(out.begin(), out.end(), tok) == out.end()) out.push_back(tok);
        }
        return out;
    }

    namespace
    {
        void collect(const RenderNode& n, const std::vector<std::string>& want,
            std::vector<const RenderNode*>& out)
        {
            const bool match = std::all_of(want.begin(), want.end(),
                [&n](const std::string& c) { return n.has_class(c); });
            if (match) out.push_back(&n);
            for (const auto& child : n.children) collect(child, want, out);
        }
    } // namespace

    std::vector<const RenderNode*> query_selector_all(const RenderNode& root,
        const std::string& selector)
    {
        std::vector<std::string> want;
        std::string cur;
        for (char c : selector)
        {
            if (c == '.')
            {
                if (!cur.empty()) want.push_back(cur);
                cur.clear();
            }
            else if (!std::isspace(static_cast<unsigned char>(c)))
            {
                cur += c;
            }
        }
        if (!cur.empty()) want.push_back(cur);

        std::vector<const RenderNode*> out;
        if (want.empty()) return out;
        collect(root, want, out);
        return out;
    }

} // namespace bpocv
