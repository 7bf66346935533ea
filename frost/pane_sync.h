// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef PANE_SYNC_H_6014723985120746381
#define PANE_SYNC_H_6014723985120746381

#include "native_pane.h"


namespace frost
{
struct PaneLayout
{
    PaneRect frozen;
    PaneRect normal;
};

//frozen pane: x in [0, sum of frozen widths), normal pane: the rest
PaneLayout calcPaneLayout(const ColumnRegistry& columns, int clientWidth, int clientHeight, int normalHScrollBarHeight);


/*  make two panes behave as one viewport:
    - normal pane leads scrolling: vertical scroll and mouse wheel
    - frozen pane leads focus
    - events of both panes go through the same handlers, parameterized by source pane        */
class PaneSynchronizer
{
public:
    PaneSynchronizer(ColumnRegistry& columns, PanePair& panes) : columns_(columns), panes_(panes) {}

    void updateLayout(int clientWidth, int clientHeight);

    void onVerticalScroll(PaneId source, int dyRows);
    void onMouseMove (PaneId source, int y);
    void onMouseLeave(PaneId source);
    bool onMouseWheel(PaneId source, int rotation, int wheelDelta); //return "true" if forwarded
    void onMouseDown (PaneId source);
    void onFocusGained(PaneId source);
    void onWindowActivated();
    void onColumnResized(size_t col, int width);

    bool isLastColumnStretched() const { return lastColumnStretched_; }
    void setLastColumnStretched(bool stretched);

    void onEraseBackground(); //stretch last column if enabled
    void stretchLastColumn();

    int getRowsPerPage() const { return panes_[PaneId::normal].getRowsPerPage(); }

private:
    PaneSynchronizer           (const PaneSynchronizer&) = delete;
    PaneSynchronizer& operator=(const PaneSynchronizer&) = delete;

    ColumnRegistry& columns_;
    PanePair& panes_;

    int clientWidth_  = 0;
    int clientHeight_ = 0;
    bool lastColumnStretched_ = false;

    //"operation is already on the call stack":
    bool scrolling_    = false;
    bool inMouseEvent_ = false;
    bool inEraseBkgnd_ = false;
};
}

#endif //PANE_SYNC_H_6014723985120746381
