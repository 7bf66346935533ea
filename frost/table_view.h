// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef TABLE_VIEW_H_4417920385561802317
#define TABLE_VIEW_H_4417920385561802317

#include <memory>
#include <wx/panel.h>
#include "pane.h"
#include "pane_sync.h"
#include "layout_config.h"


//virtual table with a frozen column area: two panes acting as one viewport
namespace frost
{
//------------------------ events ------------------------------------------------
wxDECLARE_EVENT(EVENT_TABLE_CURRENT_INDEX_CHANGED, wxCommandEvent);
wxDECLARE_EVENT(EVENT_TABLE_SELECTION_CHANGED,     wxCommandEvent);
wxDECLARE_EVENT(EVENT_TABLE_ITEM_ACTIVATED,        wxCommandEvent);

struct TableColumnClickEvent;
wxDECLARE_EVENT(EVENT_TABLE_COLUMN_CLICKED, TableColumnClickEvent);


struct TableColumnClickEvent : public wxCommandEvent
{
    explicit TableColumnClickEvent(size_t col) : wxCommandEvent(EVENT_TABLE_COLUMN_CLICKED), col_(col) {}
    TableColumnClickEvent* Clone() const override { return new TableColumnClickEvent(*this); }

    const size_t col_; //logical index
};

//--------------------------------------------------------------------------------

class TableView : public wxPanel
{
public:
    TableView(wxWindow* parent,
              wxWindowID id        = wxID_ANY,
              const wxPoint& pos   = wxDefaultPosition,
              const wxSize& size   = wxDefaultSize,
              long style           = wxTAB_TRAVERSAL | wxBORDER_NONE,
              const wxString& name = wxASCII_STR(wxPanelNameStr));
    ~TableView();

    //changes are picked up immediately: panes are re-laid out and repainted
    ColumnRegistry& refColumns() { return columns_; }
    const ColumnRegistry& getColumns() const { return columns_; }

    //-------------------- options --------------------
    bool getColumnsOrderable() const { return columnsOrderable_; }
    void setColumnsOrderable(bool value);

    bool getColumnsSizable() const { return columnsSizable_; }
    void setColumnsSizable(bool value);

    bool isHeaderHidden() const { return frozenPane_->isHeaderHidden(); }
    void setHeaderHidden(bool hidden);

    bool isSortableByHeaderClick() const { return bridge_->isSortableByHeaderClick(); }
    void setSortableByHeaderClick(bool value) { bridge_->setSortableByHeaderClick(value); }

    std::optional<Color> getAlternatingRowColor() const { return bridge_->getAlternatingRowColor(); }
    void setAlternatingRowColor(const std::optional<Color>& color);

    bool hasCheckBoxes() const { return normalPane_->hasCheckBoxes(); }
    void setCheckBoxes(bool value);

    bool isMultiSelection() const { return selection_->isMultiSelection(); }
    void setMultiSelection(bool value) { selection_->setMultiSelection(value); }

    bool isLastColumnStretched() const { return sync_->isLastColumnStretched(); }
    void setLastColumnStretched(bool value) { sync_->setLastColumnStretched(value); }

    int  getItemStateChangedDelay() const { return selection_->getItemStateChangedDelay(); } //milliseconds
    void setItemStateChangedDelay(int delayMs) { selection_->setItemStateChangedDelay(delayMs); }

    const NumberSymbols& getNumberSymbols() const { return bridge_->getNumberSymbols(); }
    void setNumberSymbols(const NumberSymbols& sym);

    int  getRowHeight() const { return normalPane_->getRowHeight(); }
    void setRowHeight(int height);

    //-------------------- model --------------------
    TableModel* getModel() const { return bridge_->getModel(); }
    void setModel(TableModel* model); //throw ModelError, NativeError; model is not owned and must outlive the view (or be reset)

    ItemChecker* getItemChecker() const { return bridge_->getItemChecker(); }
    void setItemChecker(ItemChecker* checker);
    CellStyler* getCellStyler() const { return bridge_->getCellStyler(); }
    void setCellStyler(CellStyler* styler);

    SortState getSortState() const { return bridge_->getSortState(); }
    void sort(const SortState& state) { bridge_->sort(state); } //throw ModelError

    //-------------------- selection --------------------
    int getCurrentIndex() const { return selection_->getCurrentIndex(); } //-1 if none
    void setCurrentIndex(int index); //throw NativeError

    const std::vector<int>& getSelectedIndexes() const { return selection_->getSelectedIndexes(); }
    void setSelectedIndexes(const std::vector<int>& indexes) { selection_->setSelectedIndexes(indexes); } //throw NativeError

    //-------------------- layout --------------------
    PersistedLayout saveLayout() const;
    void restoreLayout(const PersistedLayout& layout); //throw ModelError

    //settings collaborator used by saveState()/restoreState(); store not owned
    void setPersistent(LayoutStore* store, const std::string& key);
    bool isPersistent() const { return layoutStore_ != nullptr; }
    void saveState();    //throw FileError
    void restoreState(); //throw FileError, ModelError

    //-------------------- misc --------------------
    void updateItem(size_t row) { bridge_->updateItem(row); } //throw ModelError
    void invalidate() { bridge_->redrawAll(); }
    int getRowsPerPage() const { return sync_->getRowsPerPage(); }
    std::vector<size_t> getVisibleColumnsInDisplayOrder() const { return columns_.visibleColumnsInDisplayOrder(); }

private:
    TableView           (const TableView&) = delete;
    TableView& operator=(const TableView&) = delete;

    class TimerScheduler;

    void bindPaneEvents(Pane& pane);
    void onColumnsChanged();
    void onPaneMouseDown(PaneId source, ptrdiff_t row);
    void onSize(wxSizeEvent& event);
    void onTopLevelActivate(wxActivateEvent& event);

    ColumnRegistry columns_;

    Pane* frozenPane_ = nullptr; //owned by wxWindow
    Pane* normalPane_ = nullptr; //

    std::unique_ptr<PanePair>            panes_;
    std::unique_ptr<TimerScheduler>      scheduler_;
    std::unique_ptr<SelectionController> selection_;
    std::unique_ptr<DataBridge>          bridge_;
    std::unique_ptr<PaneSynchronizer>    sync_;

    bool columnsOrderable_ = true;
    bool columnsSizable_   = true;

    LayoutStore* layoutStore_ = nullptr;
    std::string layoutKey_;

    wxWindow* topLevelWin_ = nullptr;
};
}

#endif //TABLE_VIEW_H_4417920385561802317
