#pragma once

#include "model/Pane.h"

namespace ll
{

/** The fixed start-up layout on a 100 x 40 cell grid.

    Row 0 is the top bar. The sidebar (20 columns) holds Connections above the
    SchemaExplorer, the main area holds QueryInput above Results, and the last
    row is the CommandLine.
*/
namespace Layout
{
    static constexpr int gridWidth = 100;
    static constexpr int gridHeight = 40;

    std::vector<std::unique_ptr<Pane>> createDefaultPanes (Registers& registers,
                                                           EditingMode defaultMode);
}

} // namespace ll
