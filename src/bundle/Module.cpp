//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Module.cpp
/// @brief Parsing, binding bookkeeping and definition requests for a module.
///
/// @details Parsing splits the program into one Statement per top-level item;
/// every statement's buffer is a window over a single shared copy of the
/// module text, so node offsets stay meaningful in all of them.
///
/// Analysis records imports and exports before any statement is analysed,
/// because the reassignment check of a statement consults the import table
/// regardless of where the import appears in the file.
///
//===----------------------------------------------------------------------===//

#include "bundle/Module.hpp"

#include "bundle/Identifiers.hpp"
#include "frontends/js/Lexer.hpp"
#include "frontends/js/Parser.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

namespace shake::bundle
{

using frontends::js::as;
using frontends::js::Node;
using frontends::js::NodeKind;

namespace js = frontends::js;

namespace
{

/// @brief Name bound by a class or function declaration, or empty when anonymous.
std::string declaredName(const Node &node)
{
    if (node.is(NodeKind::FunctionDeclaration))
    {
        const auto &fn = as<js::FunctionNode>(node);
        return fn.id ? fn.id->name : std::string{};
    }
    if (node.is(NodeKind::ClassDeclaration))
    {
        const auto &cls = as<js::ClassNode>(node);
        return cls.id ? cls.id->name : std::string{};
    }
    return {};
}

/// @brief File name of @p id without directories or extension.
std::string fileStem(const std::string &id)
{
    std::string stem = id;
    const auto slash = stem.find_last_of("/\\");
    if (slash != std::string::npos)
        stem.erase(0, slash + 1);
    const auto dot = stem.rfind('.');
    if (dot != std::string::npos && dot != 0)
        stem.erase(dot);
    return stem;
}

} // namespace

Module::Module(std::string id, std::string source, uint32_t fileId, ModuleProvider *provider)
    : id_(std::move(id)), source_(std::move(source)), fileId_(fileId), provider_(provider)
{
}

Module::Module(std::string id, bool isExternal) : id_(std::move(id)), isExternal_(isExternal) {}

std::unique_ptr<Module> Module::makeExternal(std::string id)
{
    return std::unique_ptr<Module>(new Module(std::move(id), true));
}

support::Expected<void> Module::parse()
{
    support::DiagnosticEngine diag;
    js::Lexer lexer(source_, fileId_, diag);
    js::Parser parser(lexer, diag);
    auto program = parser.parseProgram();

    if (parser.hasError() || diag.errorCount() != 0)
    {
        for (const auto &d : diag.diagnostics())
        {
            if (d.severity == support::Severity::Error)
                return d;
        }
        return support::makeError(locate(0), "failed to parse module " + id_, "S2000");
    }

    edit::EditBuffer buffer(source_);
    for (auto &item : program->body)
    {
        const uint32_t start = item->start;
        const uint32_t end = item->end;
        statements_.push_back(
            std::make_unique<Statement>(std::move(item), buffer.snip(start, end), *this));
    }
    return {};
}

support::Expected<void> Module::recordBindings(Statement &stmt)
{
    const Node &node = stmt.node();
    Statement *owner = &stmt;

    auto addExport = [&](const std::string &exportedName, ExportBinding binding) -> support::Expected<void>
    {
        if (exports_.count(exportedName))
            return support::makeError(locate(node.start), "Duplicated export '" + exportedName + "'", "S3001");
        exports_.emplace(exportedName, std::move(binding));
        exportOrder_.push_back(exportedName);
        return {};
    };

    switch (node.kind)
    {
        case NodeKind::ImportDeclaration:
        {
            const auto &decl = as<js::ImportDeclaration>(node);
            for (const auto &spec : decl.specifiers)
            {
                const std::string &local = spec->local->name;
                if (imports_.count(local))
                {
                    return support::makeError(
                        locate(spec->local->start), "Duplicated import '" + local + "'", "S3001");
                }

                ImportBinding binding;
                binding.source = decl.source->value;
                binding.localName = local;
                if (spec->is(NodeKind::ImportDefaultSpecifier))
                    binding.originalName = "default";
                else if (spec->is(NodeKind::ImportNamespaceSpecifier))
                    binding.originalName = "*";
                else
                    binding.originalName = spec->imported->name;
                imports_.emplace(local, std::move(binding));
            }
            return {};
        }

        case NodeKind::ExportDefaultDeclaration:
        {
            const auto &decl = as<js::ExportDefaultDeclaration>(node);
            ExportBinding binding;
            binding.localName = declaredName(*decl.declaration);
            binding.statement = owner;
            return addExport("default", std::move(binding));
        }

        case NodeKind::ExportNamedDeclaration:
        {
            const auto &decl = as<js::ExportNamedDeclaration>(node);
            if (decl.declaration)
            {
                std::vector<std::string> names;
                if (decl.declaration->is(NodeKind::VariableDeclaration))
                {
                    for (const auto &declarator : as<js::VariableDeclaration>(*decl.declaration).declarations)
                        names.push_back(declarator->id->name);
                }
                else
                {
                    names.push_back(declaredName(*decl.declaration));
                }

                for (const std::string &name : names)
                {
                    ExportBinding binding;
                    binding.localName = name;
                    binding.statement = owner;
                    if (auto r = addExport(name, std::move(binding)); !r)
                        return r;
                }
                return {};
            }

            for (const auto &spec : decl.specifiers)
            {
                ExportBinding binding;
                binding.localName = spec->local->name;
                binding.statement = owner;
                if (decl.source)
                {
                    binding.source = decl.source->value;
                    binding.importedName = spec->local->name;
                }
                if (auto r = addExport(spec->exported->name, std::move(binding)); !r)
                    return r;
            }
            return {};
        }

        default:
            return {};
    }
}

support::Expected<void> Module::analyse()
{
    for (const auto &stmt : statements_)
    {
        if (auto r = recordBindings(*stmt); !r)
            return r;
    }

    for (const auto &stmt : statements_)
    {
        if (auto r = stmt->analyse(); !r)
            return r;

        for (const std::string &name : stmt->defines())
        {
            // A redeclaration (`var x = 1; var x = 2;`) acts as a modifier of the first.
            auto [it, inserted] = definitions_.emplace(name, stmt.get());
            if (!inserted)
                modifications_[name].push_back(stmt.get());
        }
        for (const std::string &name : stmt->modifies())
        {
            StatementList &modifiers = modifications_[name];
            if (modifiers.empty() || modifiers.back() != stmt.get())
                modifiers.push_back(stmt.get());
        }
    }
    return {};
}

support::Expected<Module *> Module::fetch(const std::string &source)
{
    if (!provider_)
    {
        return support::makeError(
            locate(0), "Could not resolve '" + source + "' from " + id_, "S4000");
    }
    return provider_->fetchModule(source, id_);
}

support::Expected<StatementList> Module::define(const std::string &name)
{
    if (isExternal_ || !defineRequests_.insert(name))
        return StatementList{};

    if (support::TraceSink *sink = trace())
        sink->onDefine(id_, name);

    auto imported = imports_.find(name);
    if (imported != imports_.end())
    {
        ImportBinding &binding = imported->second;
        if (!binding.module)
        {
            auto fetched = fetch(binding.source);
            if (!fetched)
                return fetched.error();
            binding.module = fetched.value();
        }
        Module &exporter = *binding.module;

        if (exporter.isExternal())
        {
            if (binding.isNamespace())
                exporter.suggestName("*", name);
            else if (binding.originalName == "default")
                exporter.suggestName("default", name);
            return StatementList{};
        }

        if (binding.isNamespace())
        {
            exporter.suggestName("*", name);
            exporter.needsNamespace_ = true;
            return exporter.expandAllStatements(false);
        }

        if (binding.originalName == "default")
            exporter.suggestName("default", name);
        return exporter.defineExport(binding.originalName, id_);
    }

    if (name == "default")
    {
        auto exported = exports_.find("default");
        if (exported != exports_.end())
        {
            ExportBinding &binding = exported->second;
            if (!binding.localName.empty())
                return define(binding.localName);
            return binding.statement->expand();
        }
    }

    Statement *stmt = definition(name);
    if (!stmt)
        return StatementList{};
    return stmt->expand();
}

support::Expected<StatementList> Module::defineExport(const std::string &exportedName,
                                                      const std::string &importer)
{
    if (isExternal_)
        return StatementList{};

    auto it = exports_.find(exportedName);
    if (it == exports_.end())
    {
        return support::makeError(locate(0),
                                  "Module " + id_ + " does not export " + exportedName +
                                      " (imported by " + importer + ")",
                                  "S3002");
    }

    ExportBinding &binding = it->second;
    if (binding.isReexport())
    {
        if (!binding.module)
        {
            auto fetched = fetch(binding.source);
            if (!fetched)
                return fetched.error();
            binding.module = fetched.value();
        }
        return binding.module->defineExport(binding.importedName, id_);
    }

    if (binding.localName.empty())
        return define("default");
    return define(binding.localName);
}

support::Expected<StatementList> Module::expandAllStatements(bool isEntry)
{
    StatementList all;
    auto append = [&all](const StatementList &more) { all.insert(all.end(), more.begin(), more.end()); };

    for (const auto &stmt : statements_)
    {
        if (stmt->isImportDeclaration())
            continue;

        const Node &node = stmt->node();
        if (node.is(NodeKind::ExportNamedDeclaration) && !as<js::ExportNamedDeclaration>(node).declaration)
        {
            const auto &decl = as<js::ExportNamedDeclaration>(node);
            if (decl.source)
            {
                for (const auto &spec : decl.specifiers)
                {
                    auto expanded = defineExport(spec->exported->name, id_);
                    if (!expanded)
                        return expanded.error();
                    append(expanded.value());
                }
                continue;
            }
            // Only the entry's export lists must pull in what they name.
            if (!isEntry)
                continue;
        }

        auto expanded = stmt->expand();
        if (!expanded)
            return expanded.error();
        append(expanded.value());
    }
    return all;
}

//===----------------------------------------------------------------------===//
// Canonical names
//===----------------------------------------------------------------------===//

void Module::rename(const std::string &name, const std::string &replacement)
{
    canonicalNames_[name] = replacement;
    if (support::TraceSink *sink = trace())
        sink->onRename(id_, name, replacement);
}

void Module::suggestName(const std::string &key, const std::string &suggestion)
{
    suggestedNames_.emplace(key, suggestion);
}

std::string Module::defaultName() const
{
    std::string name = makeLegalIdentifier(fileStem(id_));
    while (definitions_.count(name) || imports_.count(name))
        name = "_" + name;
    return name;
}

std::string Module::getCanonicalName(const std::string &localName) const
{
    if (isExternal_)
    {
        // An external module is a single `require` result, whatever the key.
        for (const char *key : {"*", "default"})
        {
            auto it = canonicalNames_.find(key);
            if (it != canonicalNames_.end())
                return it->second;
        }
        for (const char *key : {"*", "default"})
        {
            auto it = suggestedNames_.find(key);
            if (it != suggestedNames_.end())
                return it->second;
        }
        return defaultName();
    }

    auto renamed = canonicalNames_.find(localName);
    if (renamed != canonicalNames_.end())
        return renamed->second;

    if (localName == "default" || localName == "*")
    {
        auto suggested = suggestedNames_.find(localName);
        return suggested != suggestedNames_.end() ? suggested->second : defaultName();
    }

    auto imported = imports_.find(localName);
    if (imported != imports_.end() && imported->second.module)
    {
        const ImportBinding &binding = imported->second;
        if (binding.isNamespace())
            return binding.module->getCanonicalName("*");
        return binding.module->getExportCanonicalName(binding.originalName);
    }

    return localName;
}

std::string Module::getExportCanonicalName(const std::string &exportedName) const
{
    if (isExternal_)
    {
        const std::string object = getCanonicalName("*");
        if (exportedName == "default" || exportedName == "*")
            return object;
        return propertyAccess(object, exportedName);
    }

    auto it = exports_.find(exportedName);
    if (it == exports_.end())
        return exportedName;

    const ExportBinding &binding = it->second;
    if (binding.isReexport() && binding.module)
        return binding.module->getExportCanonicalName(binding.importedName);
    if (binding.localName.empty())
        return getCanonicalName("default");
    return getCanonicalName(binding.localName);
}

//===----------------------------------------------------------------------===//
// Accessors
//===----------------------------------------------------------------------===//

const ImportBinding *Module::findImport(const std::string &name) const
{
    auto it = imports_.find(name);
    return it == imports_.end() ? nullptr : &it->second;
}

Statement *Module::definition(const std::string &name) const
{
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : it->second;
}

const StatementList *Module::modifications(const std::string &name) const
{
    auto it = modifications_.find(name);
    return it == modifications_.end() ? nullptr : &it->second;
}

support::SourceLoc Module::locate(uint32_t offset) const
{
    return support::locateOffset(fileId_, source_, offset);
}

} // namespace shake::bundle
