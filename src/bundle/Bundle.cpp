//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Bundle.cpp
/// @brief Module fetching, name deconfliction and CommonJS code generation.
///
/// @details Deconfliction considers every binding that reaches the output
/// at module level: the definitions of included statements, anonymous
/// default exports, namespace objects and external `require` results.  When
/// several modules define the same name, modules are visited in fetch order
/// with the entry moved last, and only the last definer keeps the name.  The
/// others are prefixed with `_` until the name is unused.  Globals the
/// included code reads (and the names the CommonJS wrapper binds) are never
/// handed out.
///
//===----------------------------------------------------------------------===//

#include "bundle/Bundle.hpp"

#include "bundle/Identifiers.hpp"

#include <unordered_set>

namespace shake::bundle
{

using frontends::js::as;
using frontends::js::Node;
using frontends::js::NodeKind;

namespace js = frontends::js;

namespace
{

support::TraceConfig withSourceManager(support::TraceConfig cfg, const support::SourceManager &sm)
{
    if (!cfg.sm)
        cfg.sm = &sm;
    return cfg;
}

/// @brief The variable declaration @p node introduces at module level, if any.
const js::VariableDeclaration *topLevelVariables(const Node &node)
{
    if (node.is(NodeKind::VariableDeclaration))
        return &as<js::VariableDeclaration>(node);
    if (node.is(NodeKind::ExportNamedDeclaration))
    {
        const auto &decl = as<js::ExportNamedDeclaration>(node);
        if (decl.declaration && decl.declaration->is(NodeKind::VariableDeclaration))
            return &as<js::VariableDeclaration>(*decl.declaration);
    }
    return nullptr;
}

bool isExportList(const Node &node)
{
    return node.is(NodeKind::ExportNamedDeclaration) && !as<js::ExportNamedDeclaration>(node).declaration;
}

bool isNamedDeclaration(const Node &node)
{
    if (node.is(NodeKind::FunctionDeclaration))
        return as<js::FunctionNode>(node).id != nullptr;
    if (node.is(NodeKind::ClassDeclaration))
        return as<js::ClassNode>(node).id != nullptr;
    return false;
}

} // namespace

Bundle::Bundle(BundleOptions options, ModuleLoader &loader, support::SourceManager &sm)
    : options_(std::move(options)), loader_(loader), sm_(sm),
      trace_(withSourceManager(options_.trace, sm))
{
}

Module *Bundle::findModule(const std::string &id) const
{
    auto it = modules_.find(id);
    return it == modules_.end() ? nullptr : it->second.get();
}

support::Expected<Module *> Bundle::fetchModule(const std::string &importee, const std::string &importer)
{
    const std::optional<std::string> resolved = loader_.resolveId(importee, importer);
    const std::string id = resolved ? *resolved : importee;

    if (Module *cached = findModule(id))
        return cached;

    if (!resolved)
    {
        auto external = Module::makeExternal(id);
        Module *raw = external.get();
        modules_.emplace(id, std::move(external));
        moduleOrder_.push_back(raw);
        if (support::TraceSink *sink = trace())
            sink->onModuleFetched(id, true);
        return raw;
    }

    auto text = loader_.load(id);
    if (!text)
        return text.error();

    const uint32_t fileId = sm_.addFile(id);
    sm_.setText(fileId, text.value());

    auto module = std::make_unique<Module>(id, std::move(text.value()), fileId, this);
    Module *raw = module.get();
    modules_.emplace(id, std::move(module));
    moduleOrder_.push_back(raw);
    if (support::TraceSink *sink = trace())
        sink->onModuleFetched(id, false);

    if (auto parsed = raw->parse(); !parsed)
        return parsed.error();
    if (auto analysed = raw->analyse(); !analysed)
        return analysed.error();
    return raw;
}

support::Expected<void> Bundle::build()
{
    auto entry = fetchModule(options_.entry, std::string());
    if (!entry)
        return entry.error();
    entry_ = entry.value();
    if (entry_->isExternal())
        return support::makeError({}, "Could not resolve entry module " + options_.entry, "S4000");

    auto included = entry_->expandAllStatements(true);
    if (!included)
        return included.error();
    statements_ = std::move(included.value());

    deconflict();
    return {};
}

void Bundle::deconflict()
{
    std::vector<Module *> order;
    for (Module *module : moduleOrder_)
    {
        if (module != entry_)
            order.push_back(module);
    }
    order.push_back(entry_);

    struct Binding
    {
        Module *module;
        std::string key;
    };

    NameSet proposed;
    std::unordered_map<std::string, std::vector<Binding>> definers;
    auto propose = [&](Module *module, const std::string &key, const std::string &name)
    {
        std::vector<Binding> &list = definers[name];
        if (!list.empty() && list.back().module == module && list.back().key == key)
            return;
        proposed.insert(name);
        list.push_back({module, key});
    };

    for (Module *module : order)
    {
        if (module->isExternal())
        {
            propose(module, "*", module->getCanonicalName("*"));
            continue;
        }

        for (const auto &stmt : module->statements())
        {
            if (!stmt->isIncluded())
                continue;
            for (const std::string &name : stmt->defines())
                propose(module, name, name);
        }

        auto def = module->exports().find("default");
        if (def != module->exports().end() && def->second.localName.empty() &&
            def->second.statement->isIncluded())
        {
            propose(module, "default", module->getCanonicalName("default"));
        }

        if (module->needsNamespace())
            propose(module, "*", module->getCanonicalName("*"));
    }

    NameSet reserved;
    reserved.insert("exports");
    reserved.insert("require");
    reserved.insert("module");
    reserved.insert(options_.exportsName.substr(0, options_.exportsName.find('.')));
    for (const Statement *stmt : statements_)
    {
        const Module &module = stmt->module();
        for (const std::string &name : stmt->dependsOn())
        {
            if (!module.definition(name) && !module.findImport(name))
                reserved.insert(name);
        }
    }

    std::unordered_set<std::string> used(reserved.begin(), reserved.end());
    used.insert(proposed.begin(), proposed.end());

    for (const std::string &name : proposed)
    {
        const std::vector<Binding> &list = definers[name];
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            const Binding &binding = list[i];
            std::string chosen = name;
            if (i + 1 != list.size() || reserved.contains(name))
            {
                do
                {
                    chosen = "_" + chosen;
                } while (used.count(chosen));
                used.insert(chosen);
            }

            // `default` and `*` are fixed even when unchanged, so later
            // suggestions cannot move them.
            if (chosen != binding.key || binding.key == "default" || binding.key == "*")
                binding.module->rename(binding.key, chosen);
        }
    }
}

NameMap Bundle::entryExportTargets() const
{
    NameMap targets;
    for (const std::string &exported : entry_->exportOrder())
    {
        const ExportBinding &binding = entry_->exports().at(exported);
        if (binding.isReexport() || binding.localName.empty())
            continue;
        const Statement *def = entry_->definition(binding.localName);
        if (!def || !topLevelVariables(def->node()))
            continue;
        targets.emplace(binding.localName, propertyAccess(options_.exportsName, exported));
    }
    return targets;
}

NameMap Bundle::namesFor(const Module &module) const
{
    NameMap names;
    auto add = [&](const std::string &name)
    {
        if (names.count(name))
            return;
        std::string canonical = module.getCanonicalName(name);
        if (canonical != name)
            names.emplace(name, std::move(canonical));
    };

    for (const auto &stmt : module.statements())
    {
        if (!stmt->isIncluded())
            continue;
        for (const std::string &name : stmt->dependsOn())
            add(name);
        for (const std::string &name : stmt->defines())
            add(name);
        for (const std::string &name : stmt->modifies())
            add(name);
    }

    // A sole declarator is rewritten in place, so every reference follows it
    // onto the exports object.
    if (&module == entry_)
    {
        for (const auto &[local, target] : entryExportTargets())
        {
            const js::VariableDeclaration *decl = topLevelVariables(entry_->definition(local)->node());
            if (decl->declarations.size() == 1)
                names[local] = target;
        }
    }
    return names;
}

support::Expected<std::string> Bundle::generate() const
{
    if (!entry_)
        return support::makeError({}, "generate() called before a successful build()");

    std::string out = "'use strict';\n\n";

    bool anyExternal = false;
    for (const Module *module : moduleOrder_)
    {
        if (!module->isExternal())
            continue;
        out += "var " + module->getCanonicalName("*") + " = require('" + module->id() + "');\n";
        anyExternal = true;
    }
    if (anyExternal)
        out += "\n";

    for (const Module *module : moduleOrder_)
    {
        if (module->isExternal() || !module->needsNamespace())
            continue;
        out += "var " + module->getCanonicalName("*") + " = {\n";
        const std::vector<std::string> &order = module->exportOrder();
        for (std::size_t i = 0; i < order.size(); ++i)
        {
            out += "\tget " + order[i] + " () { return " + module->getExportCanonicalName(order[i]) + "; }";
            out += i + 1 == order.size() ? "\n" : ",\n";
        }
        out += "};\n\n";
    }

    const NameMap targets = entryExportTargets();
    const NameMap noTargets;
    std::unordered_map<const Module *, NameMap> names;

    for (const Statement *stmt : statements_)
    {
        const Node &node = stmt->node();
        if (stmt->isImportDeclaration() || isExportList(node))
            continue;

        const Module &module = stmt->module();
        auto cached = names.find(&module);
        if (cached == names.end())
            cached = names.emplace(&module, namesFor(module)).first;

        auto rendered = stmt->replaceIdentifiers(cached->second, &module == entry_ ? targets : noTargets);
        if (!rendered)
            return rendered.error();
        edit::EditBuffer buffer = std::move(rendered.value());

        bool terminate = false;
        if (node.is(NodeKind::ExportNamedDeclaration))
        {
            const Node &decl = *as<js::ExportNamedDeclaration>(node).declaration;
            if (auto removed = buffer.remove(node.start, decl.start); !removed)
                return removed.error();
        }
        else if (node.is(NodeKind::ExportDefaultDeclaration))
        {
            const Node &decl = *as<js::ExportDefaultDeclaration>(node).declaration;
            if (isNamedDeclaration(decl))
            {
                if (auto removed = buffer.remove(node.start, decl.start); !removed)
                    return removed.error();
            }
            else
            {
                const std::string head = "var " + module.getCanonicalName("default") + " = ";
                if (auto replaced = buffer.overwrite(node.start, decl.start, head); !replaced)
                    return replaced.error();
                terminate = true;
            }
        }

        std::string text = buffer.toString();
        if (terminate && (text.empty() || text.back() != ';'))
            text += ';';
        out += text;
        out += "\n\n";
    }

    const NameMap &entryNames = names.count(entry_) ? names.at(entry_) : namesFor(*entry_);
    std::string trailer;
    for (const std::string &exported : entry_->exportOrder())
    {
        const std::string target = propertyAccess(options_.exportsName, exported);
        const ExportBinding &binding = entry_->exports().at(exported);

        std::string value = entry_->getExportCanonicalName(exported);
        if (!binding.isReexport() && !binding.localName.empty())
        {
            auto handled = targets.find(binding.localName);
            if (handled != targets.end() && handled->second == target)
                continue;
            auto renamed = entryNames.find(binding.localName);
            if (renamed != entryNames.end())
                value = renamed->second;
        }
        trailer += target + " = " + value + ";\n";
    }
    out += trailer;

    while (out.size() >= 2 && out[out.size() - 1] == '\n' && out[out.size() - 2] == '\n')
        out.pop_back();
    return out;
}

} // namespace shake::bundle
