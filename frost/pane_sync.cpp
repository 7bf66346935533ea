// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "pane_sync.h"
#include <algorithm>
#include <zen/scope_guard.h>

using namespace zen;
using namespace frost;


PaneLayout frost::calcPaneLayout(const ColumnRegistry& columns, int clientWidth, int clientHeight, int normalHScrollBarHeight)
{
    int frozenWidth = 0;
    for (const size_t col : columns.visibleColumns())
        if (columns.getColumn(col).frozen)
            frozenWidth += columns.getColumn(col).width;

    frozenWidth = std::min(frozenWidth, std::max(clientWidth, 0));

    PaneLayout layout;
    layout.frozen = {0, 0, frozenWidth, std::max(clientHeight - normalHScrollBarHeight, 0)};
    layout.normal = {frozenWidth, 0, std::max(clientWidth - frozenWidth, 0), std::max(clientHeight, 0)};
    return layout;
}


void PaneSynchronizer::updateLayout(int clientWidth, int clientHeight)
{
    clientWidth_  = clientWidth;
    clientHeight_ = clientHeight;

    const PaneLayout layout = calcPaneLayout(columns_, clientWidth, clientHeight, panes_.normal().getHScrollBarHeight());

    panes_.normal().setBounds(layout.normal);
    panes_.frozen().setBounds(layout.frozen);
}


void PaneSynchronizer::onVerticalScroll(PaneId source, int dyRows)
{
    if (scrolling_ || dyRows == 0) //propagated scroll coming back
        return;
    scrolling_ = true;
    ZEN_ON_SCOPE_EXIT(scrolling_ = false);

    panes_[otherPane(source)].scrollByPixels(dyRows * panes_[source].getRowHeight());
}


void PaneSynchronizer::onMouseMove(PaneId source, int y)
{
    if (inMouseEvent_)
        return;
    inMouseEvent_ = true;
    ZEN_ON_SCOPE_EXIT(inMouseEvent_ = false);

    panes_[otherPane(source)].forwardMouseMove(y); //vertical component only
}


void PaneSynchronizer::onMouseLeave(PaneId source)
{
    if (inMouseEvent_)
        return;
    inMouseEvent_ = true;
    ZEN_ON_SCOPE_EXIT(inMouseEvent_ = false);

    panes_[otherPane(source)].forwardMouseLeave();
}


bool PaneSynchronizer::onMouseWheel(PaneId source, int rotation, int wheelDelta)
{
    if (source != PaneId::frozen)
        return false;

    panes_.normal().forwardMouseWheel(rotation, wheelDelta);
    return true;
}


void PaneSynchronizer::onMouseDown(PaneId source)
{
    if (source == PaneId::normal)
        panes_.frozen().setFocus();
}


void PaneSynchronizer::onFocusGained(PaneId source)
{
    if (source == PaneId::frozen)
        panes_.normal().setFocus();
}


void PaneSynchronizer::onWindowActivated()
{
    if (panes_.normal().hasFocus())
        panes_.frozen().setFocus();
}


void PaneSynchronizer::onColumnResized(size_t col, int width)
{
    columns_.setWidth(col, width);
    updateLayout(clientWidth_, clientHeight_); //frozen pane width may have changed
}


void PaneSynchronizer::setLastColumnStretched(bool stretched)
{
    if (stretched)
        stretchLastColumn();

    lastColumnStretched_ = stretched;
}


void PaneSynchronizer::onEraseBackground()
{
    if (lastColumnStretched_ && !inEraseBkgnd_)
    {
        inEraseBkgnd_ = true;
        ZEN_ON_SCOPE_EXIT(inEraseBkgnd_ = false);

        stretchLastColumn();
    }
}


void PaneSynchronizer::stretchLastColumn()
{
    const size_t colCount = columns_.getDisplayNames(PaneId::normal).size();
    if (colCount == 0)
        return;

    int othersWidth = 0;
    for (size_t pos = 0; pos + 1 < colCount; ++pos)
        othersWidth += columns_.getColumn(columns_.displayPosToLogical(PaneId::normal, pos)).width;

    const size_t lastCol = columns_.displayPosToLogical(PaneId::normal, colCount - 1);

    //no-op if unchanged: repeated calls converge on the same width
    columns_.setWidth(lastCol, panes_.normal().getClientWidth() - othersWidth); //clamped to minWidth
}
