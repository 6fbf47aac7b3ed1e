/**
 * @file profile.cpp
 * @brief Implementation of the section profiler
 */

#include "discsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::attachToParent(const std::string& name, Section& section) {
    if (open.empty()) {
        section.data.parent_name.clear();
        return;
    }

    const std::string& parent = open.top();
    if (section.data.parent_name == parent) {
        return;
    }

    // Called from a different parent than last time: move it.
    if (!section.data.parent_name.empty()) {
        auto& oldKids = sections[section.data.parent_name].data.children;
        oldKids.erase(std::remove(oldKids.begin(), oldKids.end(), name), oldKids.end());
    }
    section.data.parent_name = parent;

    auto& kids = sections[parent].data.children;
    if (std::find(kids.begin(), kids.end(), name) == kids.end()) {
        kids.push_back(name);
    }
}

void Profiler::startSection(const std::string& name) {
    auto& self = instance();
    auto& section = self.sections[name];
    self.attachToParent(name, section);
    section.started = Clock::now();
    self.open.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& self = instance();

    if (self.open.empty() || self.open.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open section.\n";
        return;
    }

    auto& section = self.sections[name];
    Duration const elapsed = std::chrono::duration_cast<Duration>(Clock::now() - section.started);

    section.data.total_time += elapsed;
    section.data.self_time  += elapsed;
    section.data.call_count += 1;
    section.data.min_time = std::min(section.data.min_time, elapsed);
    section.data.max_time = std::max(section.data.max_time, elapsed);

    if (!section.data.parent_name.empty()) {
        self.sections[section.data.parent_name].data.self_time -= elapsed;
    }

    self.open.pop();
}

void Profiler::printStats() {
    const auto& self = instance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration programTime{0};
    for (const auto& [name, section] : self.sections) {
        if (section.data.parent_name.empty()) {
            roots.push_back(name);
            programTime += section.data.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        self.printNode(roots[i], "", i + 1 == roots.size(), programTime);
    }
}

void Profiler::printNode(const std::string& name, const std::string& prefix,
                         bool last, Duration programTime) const {
    const auto& pd = sections.at(name).data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (programTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / programTime.count();
        selfPercent  = (pd.self_time.count() * 100.0) / programTime.count();
    }
    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();

    std::cout << prefix << (last ? "└── " : "├── ")
              << name << " [" << pd.call_count << " calls] "
              << totalMs << "ms (total: "
              << std::fixed << std::setprecision(2) << totalPercent << "%, "
              << "self: " << selfPercent << "%)\n";

    std::string const childPrefix = prefix + (last ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(pd.children[i], childPrefix, i + 1 == pd.children.size(), programTime);
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.sections.clear();
    self.open = std::stack<std::string>();
}

uint64_t Profiler::getCallCount(const std::string& name) {
    const auto& self = instance();
    auto it = self.sections.find(name);
    return it == self.sections.end() ? 0 : it->second.data.call_count;
}

std::string Profiler::getParent(const std::string& name) {
    const auto& self = instance();
    auto it = self.sections.find(name);
    return it == self.sections.end() ? std::string() : it->second.data.parent_name;
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
