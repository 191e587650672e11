#include "KeymapConfig.h"
#include "input/KeyChord.h"
#include <yaml-cpp/yaml.h>
#include <set>

namespace ll
{

void KeymapConfig::reset()
{
    userBindings = {};
    editingMode = EditingMode::Vim;
    paneModifier = PaneModifier::Shift;
    problems.clear();
}

void KeymapConfig::addProblem (const juce::String& message)
{
    problems.add (message);
    juce::Logger::writeToLog ("keymap: " + message);
}

bool KeymapConfig::loadFromFile (const juce::File& file)
{
    reset();

    if (! file.existsAsFile())
        return true;

    try
    {
        readRoot (YAML::LoadFile (file.getFullPathName().toStdString()));
    }
    catch (const YAML::Exception& e)
    {
        reset();
        addProblem (file.getFileName() + ": " + juce::String (e.what()));
        return false;
    }

    return true;
}

bool KeymapConfig::loadFromString (const juce::String& yaml)
{
    reset();

    try
    {
        readRoot (YAML::Load (yaml.toStdString()));
    }
    catch (const YAML::Exception& e)
    {
        reset();
        addProblem (juce::String (e.what()));
        return false;
    }

    return true;
}

void KeymapConfig::readRoot (const YAML::Node& root)
{
    if (! root.IsDefined() || root.IsNull())
        return;

    if (! root.IsMap())
    {
        addProblem ("top level must be a mapping");
        return;
    }

    if (auto node = root["editing_mode"])
    {
        auto value = juce::String (node.as<std::string> ("")).trim().toLowerCase();

        if (value == "vim")
            editingMode = EditingMode::Vim;
        else if (value == "cursor")
            editingMode = EditingMode::Cursor;
        else
            addProblem ("unknown editing_mode '" + value + "'");
    }

    if (auto node = root["pane_modifier"])
    {
        auto value = juce::String (node.as<std::string> (""));

        if (! paneModifierFromName (value, paneModifier))
            addProblem ("unknown pane_modifier '" + value + "'");
    }

    userBindings.setPaneModifier (paneModifier);

    auto bindings = root["bindings"];

    if (! bindings.IsDefined() || bindings.IsNull())
        return;

    if (! bindings.IsMap())
    {
        addProblem ("bindings must be a mapping of scopes");
        return;
    }

    for (auto it = bindings.begin(); it != bindings.end(); ++it)
    {
        auto scopeName = juce::String (it->first.as<std::string> (""));
        KeyMapping::Scope scope;

        if (! KeyMapping::scopeFromName (scopeName, scope))
        {
            addProblem ("unknown scope '" + scopeName + "'");
            continue;
        }

        if (! it->second.IsMap())
        {
            addProblem ("scope '" + scopeName + "' must be a mapping of chords");
            continue;
        }

        readScope (scope, it->second);
    }
}

void KeymapConfig::readScope (KeyMapping::Scope scope, const YAML::Node& entries)
{
    const auto scopeName = KeyMapping::getScopeName (scope);
    std::set<juce::String> seen;

    for (auto it = entries.begin(); it != entries.end(); ++it)
    {
        auto chordText = juce::String (it->first.as<std::string> (""));
        auto actionText = juce::String (it->second.as<std::string> (""));

        juce::String error;
        auto chord = KeyChord::canonicalise (chordText, error);

        if (chord.isEmpty())
        {
            addProblem (scopeName + ": " + error);
            continue;
        }

        NavigationAction action;

        if (! actionFromName (actionText, action))
        {
            addProblem (scopeName + ": unknown action '" + actionText + "' for " + chord);
            continue;
        }

        if (! seen.insert (chord).second)
        {
            addProblem (scopeName + ": '" + chordText + "' duplicates an earlier binding for " + chord);
            continue;
        }

        userBindings.bind (scope, chord, action);
    }
}

KeyMapping KeymapConfig::buildMapping()
{
    juce::StringArray collisions;
    auto merged = KeyMapping::merge (KeyMapping::createDefaults(), userBindings,
                                     paneModifier, &collisions);

    for (auto& c : collisions)
        addProblem (c);

    return merged;
}

// ─── Defaults file ──────────────────────────────────────────────────────────

juce::String KeymapConfig::createDefaultYaml()
{
    auto defaults = KeyMapping::createDefaults();

    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "editing_mode" << YAML::Value << "vim";
    emitter << YAML::Key << "pane_modifier" << YAML::Value << "shift";
    emitter << YAML::Key << "bindings" << YAML::Value;
    emitter << YAML::BeginMap;

    for (int s = 0; s < KeyMapping::NumScopes; ++s)
    {
        auto scope = static_cast<KeyMapping::Scope> (s);

        if (defaults.getNumBindings (scope) == 0)
            continue;

        emitter << YAML::Key << KeyMapping::getScopeName (scope).toStdString() << YAML::Value;
        emitter << YAML::BeginMap;

        for (auto& entry : defaults.getEntries (scope))
            emitter << YAML::Key << entry.first.toStdString()
                    << YAML::Value << getActionName (entry.second).toStdString();

        emitter << YAML::EndMap;
    }

    emitter << YAML::EndMap;
    emitter << YAML::EndMap;

    return juce::String (emitter.c_str());
}

bool KeymapConfig::writeDefaults (const juce::File& file)
{
    if (! file.getParentDirectory().createDirectory())
        return false;

    // Atomic write: write to .tmp, then move into place
    auto tmpFile = file.getSiblingFile (file.getFileName() + ".tmp");

    if (! tmpFile.replaceWithText (createDefaultYaml()))
        return false;

    return tmpFile.moveFileTo (file);
}

juce::File KeymapConfig::getConfigDirectory()
{
    return juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
               .getChildFile ("lazylode");
}

juce::File KeymapConfig::getDefaultFile()
{
    return getConfigDirectory().getChildFile ("keymap.yaml");
}

} // namespace ll
