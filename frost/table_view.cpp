// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "table_view.h"
#include <wx/timer.h>
#include <wx/toplevel.h>
#include <zen/extra_log.h>
#include <zen/file_error.h>
#include "table_error.h"

using namespace zen;
using namespace frost;


namespace frost
{
wxDEFINE_EVENT(EVENT_TABLE_CURRENT_INDEX_CHANGED, wxCommandEvent);
wxDEFINE_EVENT(EVENT_TABLE_SELECTION_CHANGED,     wxCommandEvent);
wxDEFINE_EVENT(EVENT_TABLE_ITEM_ACTIVATED,        wxCommandEvent);
wxDEFINE_EVENT(EVENT_TABLE_COLUMN_CLICKED,        TableColumnClickEvent);
}


namespace
{
const int ICON_SIZE_DIP = 16;
}


//one wxTimer per notification kind: StartOnce() on a running timer restarts it
class TableView::TimerScheduler : public DebounceScheduler
{
public:
    explicit TimerScheduler(const std::function<void(NotificationKind kind)>& onTimer)
    {
        currentIndexTimer_.Bind(wxEVT_TIMER, [onTimer](wxTimerEvent& event) { onTimer(NotificationKind::currentIndex); });
        selectionTimer_   .Bind(wxEVT_TIMER, [onTimer](wxTimerEvent& event) { onTimer(NotificationKind::selection); });
    }

    ~TimerScheduler() { stopAll(); }

    void schedule(NotificationKind kind, int delayMs) override { getTimer(kind).StartOnce(delayMs); }
    void cancel  (NotificationKind kind)              override { getTimer(kind).Stop(); }

    void stopAll()
    {
        currentIndexTimer_.Stop();
        selectionTimer_   .Stop();
    }

private:
    wxTimer& getTimer(NotificationKind kind) { return kind == NotificationKind::currentIndex ? currentIndexTimer_ : selectionTimer_; }

    wxTimer currentIndexTimer_;
    wxTimer selectionTimer_;
};


TableView::TableView(wxWindow* parent,
                     wxWindowID id,
                     const wxPoint& pos,
                     const wxSize& size,
                     long style,
                     const wxString& name) : wxPanel(parent, id, pos, size, style, name)
{
    frozenPane_ = new Pane(this, PaneId::frozen, columns_); //ownership handled by "this"
    normalPane_ = new Pane(this, PaneId::normal, columns_); //

    panes_     = std::make_unique<PanePair>(*frozenPane_, *normalPane_);
    scheduler_ = std::make_unique<TimerScheduler>([this](NotificationKind kind) { selection_->onTimer(kind); });
    selection_ = std::make_unique<SelectionController>(*panes_, *scheduler_);
    bridge_    = std::make_unique<DataBridge>(columns_, *panes_, *selection_);
    sync_      = std::make_unique<PaneSynchronizer>(columns_, *panes_);

    frozenPane_->setDataBridge(bridge_.get());
    normalPane_->setDataBridge(bridge_.get());

    const int iconSize = FromDIP(ICON_SIZE_DIP);
    bridge_->setImageListFactory([iconSize] { return std::make_unique<BitmapList>(iconSize); });

    columns_.setChangeCallback([this] { onColumnsChanged(); });

    //-------------------- publish to the host --------------------
    selection_->onCurrentIndexChanged = [this]
    {
        wxCommandEvent evt(EVENT_TABLE_CURRENT_INDEX_CHANGED);
        evt.SetInt(selection_->getCurrentIndex());
        GetEventHandler()->ProcessEvent(evt);
    };
    selection_->onSelectedIndexesChanged = [this]
    {
        wxCommandEvent evt(EVENT_TABLE_SELECTION_CHANGED);
        GetEventHandler()->ProcessEvent(evt);
    };
    selection_->onActivated = [this]
    {
        wxCommandEvent evt(EVENT_TABLE_ITEM_ACTIVATED);
        evt.SetInt(selection_->getCurrentIndex());
        GetEventHandler()->ProcessEvent(evt);
    };
    bridge_->onColumnClicked = [this](size_t col)
    {
        TableColumnClickEvent evt(col);
        GetEventHandler()->ProcessEvent(evt);
    };

    bindPaneEvents(*frozenPane_);
    bindPaneEvents(*normalPane_);

    Bind(wxEVT_SIZE, [this](wxSizeEvent& event) { onSize(event); });

    //top-level window is known only after construction of all parents: bind to whatever exists now
    topLevelWin_ = wxGetTopLevelParent(this);
    if (topLevelWin_)
        topLevelWin_->Bind(wxEVT_ACTIVATE, &TableView::onTopLevelActivate, this);
}


TableView::~TableView()
{
    if (topLevelWin_)
        topLevelWin_->Unbind(wxEVT_ACTIVATE, &TableView::onTopLevelActivate, this);

    scheduler_->stopAll();
    columns_.setChangeCallback(nullptr);

    selection_->detachListeners(); //no events for the host while being destroyed

    try
    {
        bridge_->setModel(nullptr); //throw ModelError, NativeError; detach observer, release images
    }
    catch (const TableError& e) { logExtraError(e.toString()); }

    frozenPane_->setDataBridge(nullptr); //panes are destroyed by wxWindow after "bridge_"
    normalPane_->setDataBridge(nullptr); //
}


void TableView::bindPaneEvents(Pane& pane)
{
    const PaneId source = pane.getPaneId();

    //handlers run inside native dispatch: failures are logged, never propagated into wxWidgets
    auto guarded = [](const std::function<void()>& fun)
    {
        try
        {
            fun(); //throw TableError
        }
        catch (const TableError& e) { logExtraError(e.toString()); }
    };

    pane.Bind(EVENT_PANE_MOUSE_DOWN, [this, source](PaneRowEvent& event)
    {
        onPaneMouseDown(source, event.row_);
        event.Skip();
    });

    pane.Bind(EVENT_PANE_ITEM_STATE, [this, source, guarded](PaneItemStateEvent& event)
    {
        guarded([&] { selection_->onNativeItemStateChanged(source, static_cast<int>(event.row_), event.selectedBefore_, event.selectedNow_); });
    });

    pane.Bind(EVENT_PANE_ROW_ACTIVATED, [this, guarded](PaneRowEvent& event)
    {
        guarded([&] { selection_->onItemActivated(static_cast<int>(event.row_)); });
    });

    pane.Bind(EVENT_PANE_DOUBLE_CLICK, [this](PaneRowEvent& event) { selection_->onDoubleClick(); });

    pane.Bind(EVENT_PANE_CHECK_CLICK, [this, guarded](PaneRowEvent& event)
    {
        guarded([&] { bridge_->toggleChecked(event.row_); });
    });

    pane.Bind(EVENT_PANE_TOGGLE_KEY, [this, guarded](PaneRowEvent& event)
    {
        if (hasCheckBoxes())
            if (const int row = selection_->getCurrentIndex();
                row >= 0)
                guarded([&] { bridge_->toggleChecked(row); });
    });

    pane.Bind(EVENT_PANE_COL_CLICK, [this, guarded](PaneColumnEvent& event)
    {
        guarded([&] { bridge_->onColumnHeaderClicked(event.col_); });
    });

    pane.Bind(EVENT_PANE_COL_RESIZE, [this](PaneColumnEvent& event)
    {
        if (columnsSizable_)
            sync_->onColumnResized(event.col_, event.width_);
    });

    pane.Bind(EVENT_PANE_COL_MOVE, [this, source](PaneColumnEvent& event)
    {
        if (columnsOrderable_)
            columns_.moveInDisplayOrder(source, event.posFrom_, event.posTo_);
    });

    pane.Bind(EVENT_PANE_SCROLLED,     [this, source](PaneMouseEvent& event) { sync_->onVerticalScroll(source, event.value_); });
    pane.Bind(EVENT_PANE_MOUSE_MOVE,   [this, source](PaneMouseEvent& event) { sync_->onMouseMove     (source, event.value_); });
    pane.Bind(EVENT_PANE_MOUSE_LEAVE,  [this, source](PaneMouseEvent& event) { sync_->onMouseLeave    (source); });
    pane.Bind(EVENT_PANE_MOUSE_WHEEL,  [this, source](PaneMouseEvent& event)
    {
        if (!sync_->onMouseWheel(source, event.value_, event.wheelDelta_))
            event.Skip(); //the pane scrolls itself
    });

    pane.Bind(EVENT_PANE_FOCUS,       [this, source](wxCommandEvent& event) { sync_->onFocusGained(source); });
    pane.Bind(EVENT_PANE_PAINT_BEGIN, [this       ](wxCommandEvent& event) { sync_->onEraseBackground(); });
}


void TableView::onPaneMouseDown(PaneId source, ptrdiff_t row)
{
    if (row >= static_cast<ptrdiff_t>(bridge_->getRowCount())) //empty space below the last row
    {
        if (isMultiSelection())
            selection_->publishNextSelectionClear();
        else if (hasCheckBoxes())
        {
            if (selection_->getCurrentIndex() >= 0)
                try
                {
                    selection_->setCurrentIndex(-1); //throw NativeError
                }
                catch (const TableError& e) { logExtraError(e.toString()); }
        }
        else //keep the current item
            sync_->onMouseDown(source);
        return;
    }

    sync_->onMouseDown(source);
}


void TableView::onColumnsChanged()
{
    frozenPane_->onColumnsChanged();
    normalPane_->onColumnsChanged();

    const wxSize clientSize = GetClientSize();
    sync_->updateLayout(clientSize.GetWidth(), clientSize.GetHeight());

    bridge_->updateSortIndicator(); //visual index of the sorted column may have changed
}


void TableView::onSize(wxSizeEvent& event)
{
    const wxSize clientSize = GetClientSize();
    sync_->updateLayout(clientSize.GetWidth(), clientSize.GetHeight());
    sync_->onEraseBackground();
    event.Skip();
}


void TableView::onTopLevelActivate(wxActivateEvent& event)
{
    if (event.GetActive())
        sync_->onWindowActivated();
    event.Skip();
}


void TableView::setColumnsOrderable(bool value)
{
    columnsOrderable_ = value;
    frozenPane_->allowColumnMove(value);
    normalPane_->allowColumnMove(value);
}


void TableView::setColumnsSizable(bool value)
{
    columnsSizable_ = value;
    frozenPane_->allowColumnResize(value);
    normalPane_->allowColumnResize(value);
}


void TableView::setHeaderHidden(bool hidden)
{
    frozenPane_->setHeaderHidden(hidden);
    normalPane_->setHeaderHidden(hidden);
}


void TableView::setAlternatingRowColor(const std::optional<Color>& color)
{
    bridge_->setAlternatingRowColor(color);
    invalidate();
}


void TableView::setCheckBoxes(bool value)
{
    frozenPane_->setCheckBoxes(value);
    normalPane_->setCheckBoxes(value);
}


void TableView::setNumberSymbols(const NumberSymbols& sym)
{
    bridge_->setNumberSymbols(sym);
    invalidate();
}


void TableView::setRowHeight(int height)
{
    frozenPane_->setRowHeight(height);
    normalPane_->setRowHeight(height);
}


void TableView::setModel(TableModel* model) //throw ModelError, NativeError
{
    bridge_->setModel(model); //throw ModelError, NativeError
}


void TableView::setItemChecker(ItemChecker* checker)
{
    bridge_->setItemChecker(checker);
    invalidate();
}


void TableView::setCellStyler(CellStyler* styler)
{
    bridge_->setCellStyler(styler);
    invalidate();
}


void TableView::setCurrentIndex(int index) //throw NativeError
{
    selection_->setCurrentIndex(index); //throw NativeError
}


PersistedLayout TableView::saveLayout() const
{
    return captureLayout(columns_, bridge_->getSortState());
}


void TableView::restoreLayout(const PersistedLayout& layout) //throw ModelError
{
    RedrawSuspension rs(*panes_);
    frost::restoreLayout(layout, columns_, *bridge_); //throw ModelError
}


void TableView::setPersistent(LayoutStore* store, const std::string& key)
{
    layoutStore_ = store;
    layoutKey_   = key;
}


void TableView::saveState() //throw FileError
{
    if (layoutStore_)
        layoutStore_->writeLayout(layoutKey_, saveLayout()); //throw FileError
}


void TableView::restoreState() //throw FileError, ModelError
{
    if (layoutStore_)
        if (const std::optional<PersistedLayout> layout = layoutStore_->readLayout(layoutKey_)) //throw FileError
            restoreLayout(*layout); //throw ModelError
}
