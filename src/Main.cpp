#include <juce_core/juce_core.h>

#include "config/KeymapConfig.h"
#include "input/TerminalInput.h"
#include "ui/AppController.h"
#include "ui/StatusLine.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <unistd.h>

namespace
{

void printUsage()
{
    std::cout << "Usage: LazyLode [--keymap <file>] [--write-keymap]\n"
                 "\n"
                 "  --keymap <file>    load key bindings from <file> instead of\n"
                 "                     " << ll::KeymapConfig::getDefaultFile().getFullPathName() << "\n"
                 "  --write-keymap     write the default bindings to the keymap file and exit\n";
}

void drawStatus (ll::ui::AppController& app, const ll::Effect& effect)
{
    auto focus = app.currentFocus();
    auto line = ll::ui::StatusLine::render (focus, app.getNavigation().getNavigationInfo());

    // Raw mode: no output post-processing, so return and clear explicitly
    std::cout << "\r\x1b[2K" << line;

    if (! effect.isNone())
        std::cout << "\r\n\x1b[2K" << effect.describe() << "\x1b[1A";

    std::cout << std::flush;
}

int runLoop (ll::ui::AppController& app)
{
    ll::RawTerminal terminal;

    if (! terminal.isActive())
    {
        std::cerr << "LazyLode needs an interactive terminal\n";
        return 1;
    }

    ll::TerminalInput decoder;
    drawStatus (app, {});

    for (;;)
    {
        char buffer[64];
        auto n = read (STDIN_FILENO, buffer, sizeof (buffer));

        if (n < 0 && errno != EAGAIN && errno != EINTR)
        {
            juce::Logger::writeToLog ("stdin read failed: " + juce::String (strerror (errno)));
            return 1;
        }

        auto keys = n > 0 ? decoder.decode (buffer, static_cast<size_t> (n))
                          : decoder.flushPending();

        for (auto& key : keys)
        {
            auto effect = app.handleKey (key);
            drawStatus (app, effect);

            if (effect.type == ll::Effect::RequestQuit)
            {
                std::cout << "\r\n" << std::flush;
                return 0;
            }
        }

        for (auto& effect : app.processCompletions())
            drawStatus (app, effect);
    }
}

} // namespace

int main (int argc, char* argv[])
{
    juce::ArgumentList args (argc, argv);

    if (args.containsOption ("--help|-h"))
    {
        printUsage();
        return 0;
    }

    auto keymapFile = ll::KeymapConfig::getDefaultFile();

    if (args.containsOption ("--keymap"))
    {
        auto value = args.getValueForOption ("--keymap");

        if (value.isEmpty())
        {
            printUsage();
            return 1;
        }

        keymapFile = juce::File::getCurrentWorkingDirectory().getChildFile (value);
    }

    if (args.containsOption ("--write-keymap"))
    {
        if (! ll::KeymapConfig::writeDefaults (keymapFile))
        {
            std::cerr << "Could not write " << keymapFile.getFullPathName() << "\n";
            return 1;
        }

        std::cout << "Wrote " << keymapFile.getFullPathName() << "\n";
        return 0;
    }

    // Log to a file; the terminal belongs to the UI
    std::unique_ptr<juce::FileLogger> logger (juce::FileLogger::createDefaultAppLogger (
        "lazylode", "lazylode.log", "LazyLode started"));
    juce::Logger::setCurrentLogger (logger.get());

    if (! keymapFile.existsAsFile() && ! args.containsOption ("--keymap"))
    {
        if (! ll::KeymapConfig::writeDefaults (keymapFile))
            juce::Logger::writeToLog ("Could not write default keymap to " + keymapFile.getFullPathName());
    }

    ll::KeymapConfig config;

    if (! config.loadFromFile (keymapFile))
        std::cerr << "Ignoring " << keymapFile.getFullPathName() << ": "
                  << config.getProblems().joinIntoString ("; ") << "\n";

    auto mapping = config.buildMapping();

    int result = 0;

    {
        ll::ui::AppController app (mapping, config.getEditingMode());
        result = runLoop (app);
    }

    juce::Logger::setCurrentLogger (nullptr);
    return result;
}
