#include <gtest/gtest.h>
#include "config/KeymapConfig.h"

using namespace ll;
using A = NavigationAction;

TEST (KeymapConfig, EmptyDocumentKeepsDefaults)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (""));
    EXPECT_EQ (config.getEditingMode(), EditingMode::Vim);
    EXPECT_EQ (config.getPaneModifier(), PaneModifier::Shift);
    EXPECT_TRUE (config.getProblems().isEmpty());

    EXPECT_EQ (config.buildMapping(),
               KeyMapping::merge (KeyMapping::createDefaults(), {}, PaneModifier::Shift));
}

TEST (KeymapConfig, ReadsSettingsAndBindings)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (
        "editing_mode: cursor\n"
        "pane_modifier: ctrl\n"
        "bindings:\n"
        "  global:\n"
        "    \"ctrl+w\": quit\n"
        "  results:\n"
        "    \"R\": first_page\n"));

    EXPECT_EQ (config.getEditingMode(), EditingMode::Cursor);
    EXPECT_EQ (config.getPaneModifier(), PaneModifier::Ctrl);
    EXPECT_TRUE (config.getProblems().isEmpty());

    auto& user = config.getUserBindings();
    EXPECT_EQ (user.lookup (KeyMapping::Global, "Ctrl+w"), A::Quit);
    EXPECT_EQ (user.lookup (KeyMapping::ResultsPane, "Shift+r"), A::FirstPage);

    auto mapping = config.buildMapping();
    EXPECT_EQ (mapping.getPaneModifier(), PaneModifier::Ctrl);
    EXPECT_EQ (mapping.lookup (KeyMapping::Global, "Ctrl+w"), A::Quit);
    EXPECT_EQ (mapping.lookup (KeyMapping::Global, "Ctrl+q"), A::Quit);
    EXPECT_EQ (mapping.lookup (KeyMapping::Global, "Ctrl+l"), A::MoveRight);
}

TEST (KeymapConfig, NoneRemovesDefaultBinding)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (
        "bindings:\n"
        "  vim_normal:\n"
        "    x: none\n"));

    auto mapping = config.buildMapping();
    EXPECT_FALSE (mapping.contains (KeyMapping::VimNormal, "x"));
    EXPECT_EQ (mapping.lookup (KeyMapping::VimNormal, "Delete"), A::DeleteChar);
}

TEST (KeymapConfig, BadEntriesAreSkippedAndReported)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (
        "editing_mode: emacs\n"
        "bindings:\n"
        "  nowhere:\n"
        "    x: quit\n"
        "  global:\n"
        "    \"Hyper+x\": quit\n"
        "    \"Ctrl+k\": fly_away\n"
        "    \"Ctrl+w\": quit\n"));

    EXPECT_EQ (config.getEditingMode(), EditingMode::Vim);
    EXPECT_EQ (config.getProblems().size(), 4);
    EXPECT_EQ (config.getUserBindings().getNumBindings (KeyMapping::Global), 1);
    EXPECT_EQ (config.getUserBindings().lookup (KeyMapping::Global, "Ctrl+w"), A::Quit);
}

TEST (KeymapConfig, DuplicateChordSpellingsKeepFirst)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (
        "bindings:\n"
        "  results:\n"
        "    G: last_page\n"
        "    \"Shift+g\": first_page\n"));

    ASSERT_EQ (config.getProblems().size(), 1);
    EXPECT_TRUE (config.getProblems()[0].contains ("duplicates"));
    EXPECT_EQ (config.getUserBindings().lookup (KeyMapping::ResultsPane, "Shift+g"), A::LastPage);
}

TEST (KeymapConfig, MalformedYamlFails)
{
    KeymapConfig config;

    EXPECT_FALSE (config.loadFromString ("bindings: [unclosed\n"));
    EXPECT_EQ (config.getProblems().size(), 1);
    EXPECT_EQ (config.getUserBindings().getNumBindings (KeyMapping::Global), 0);
}

TEST (KeymapConfig, MissingFileIsNotAnError)
{
    KeymapConfig config;
    auto missing = juce::File::getSpecialLocation (juce::File::tempDirectory)
                       .getNonexistentChildFile ("lazylode_missing", ".yaml");

    EXPECT_TRUE (config.loadFromFile (missing));
    EXPECT_TRUE (config.getProblems().isEmpty());
}

TEST (KeymapConfig, DefaultYamlReproducesDefaults)
{
    KeymapConfig config;

    ASSERT_TRUE (config.loadFromString (KeymapConfig::createDefaultYaml()));
    EXPECT_TRUE (config.getProblems().isEmpty());

    EXPECT_EQ (config.buildMapping(),
               KeyMapping::merge (KeyMapping::createDefaults(), {}, PaneModifier::Shift));
}

TEST (KeymapConfig, WriteDefaultsThenLoad)
{
    juce::TemporaryFile temp (".yaml");
    auto file = temp.getFile();

    ASSERT_TRUE (KeymapConfig::writeDefaults (file));
    EXPECT_TRUE (file.existsAsFile());
    EXPECT_FALSE (file.getSiblingFile (file.getFileName() + ".tmp").exists());

    KeymapConfig config;
    ASSERT_TRUE (config.loadFromFile (file));
    EXPECT_EQ (config.getUserBindings().lookup (KeyMapping::Global, "Ctrl+q"), A::Quit);
}
