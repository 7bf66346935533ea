// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "main_frame.h"
#include <wx/menu.h>
#include <wx/msgdlg.h>
#include <zen/extra_log.h>
#include <zen/file_error.h>
#include <zen/file_path.h>
#include <zen/format_unit.h>
#include <zen/i18n.h>
#include <zen/sys_info.h>
#include <frost/table_error.h>

using namespace zen;
using namespace frost;
using namespace frost_demo;


namespace
{
const size_t DEMO_ROW_COUNT = 100'000;
const char LAYOUT_KEY[] = "MainTable";

enum
{
    ID_TOGGLE_MULTI_SELECTION = wxID_HIGHEST + 1,
    ID_TOGGLE_CHECK_BOXES,
    ID_TOGGLE_HEADER,
    ID_TOGGLE_STRETCH,
    ID_TOGGLE_ALT_ROW_COLOR,
    ID_TOGGLE_FROZEN_NAME,
    ID_TOGGLE_SIZE_COLUMN,
    ID_APPEND_ROWS,
    ID_REMOVE_CURRENT,
    ID_TOUCH_CURRENT,
};


Zstring getLayoutFolderPath()
{
    try
    {
        return appendPath(getUserDataPath(), Zstr("FrostGridDemo")); //throw FileError
    }
    catch (const FileError& e)
    {
        logExtraError(e.toString());
        return Zstr(".");
    }
}
}


void MainFrame::create()
{
    auto frame = new MainFrame(); //ownership passed to wxWidgets
    frame->Show();
}


MainFrame::MainFrame() : wxFrame(nullptr, wxID_ANY, L"FrostGrid Demo", wxDefaultPosition, wxSize(900, 600)),
    model_(std::make_unique<DemoModel>(DEMO_ROW_COUNT)),
    layoutStore_(std::make_unique<XmlFolderLayoutStore>(getLayoutFolderPath()))
{
    auto menuView = new wxMenu;
    menuView->AppendCheckItem(ID_TOGGLE_MULTI_SELECTION, _("&Multi-selection"));
    menuView->AppendCheckItem(ID_TOGGLE_CHECK_BOXES,     _("&Check boxes"));
    menuView->AppendCheckItem(ID_TOGGLE_HEADER,          _("&Hide header"));
    menuView->AppendCheckItem(ID_TOGGLE_STRETCH,         _("&Stretch last column"));
    menuView->AppendCheckItem(ID_TOGGLE_ALT_ROW_COLOR,   _("&Alternating row color"));
    menuView->AppendSeparator();
    menuView->AppendCheckItem(ID_TOGGLE_FROZEN_NAME, _("&Freeze name column"));
    menuView->AppendCheckItem(ID_TOGGLE_SIZE_COLUMN, _("Show si&ze column"));

    auto menuRows = new wxMenu;
    menuRows->Append(ID_APPEND_ROWS,    _("&Append 10 rows"));
    menuRows->Append(ID_REMOVE_CURRENT, _("&Remove current row"));
    menuRows->Append(ID_TOUCH_CURRENT,  _("&Touch current row"));

    auto menuBar = new wxMenuBar;
    menuBar->Append(menuView, _("&View"));
    menuBar->Append(menuRows, _("&Rows"));
    SetMenuBar(menuBar);

    CreateStatusBar();

    table_ = new TableView(this);
    {
        ColumnUpdateScope updateScope(table_->refColumns());
        for (const Column& col : getDemoColumns())
            table_->refColumns().add(col);
    }
    table_->setItemStateChangedDelay(150);
    table_->setPersistent(layoutStore_.get(), LAYOUT_KEY);

    try
    {
        table_->setModel(model_.get()); //throw ModelError, NativeError
        table_->restoreState();         //throw FileError, ModelError
    }
    catch (const FileError&  e) { logExtraError(e.toString()); }
    catch (const TableError& e) { logExtraError(e.toString()); }

    menuView->Check(ID_TOGGLE_FROZEN_NAME, table_->getColumns().getColumn(static_cast<size_t>(DemoColumn::name)).frozen);
    menuView->Check(ID_TOGGLE_SIZE_COLUMN, table_->getColumns().getColumn(static_cast<size_t>(DemoColumn::size)).visible);

    table_->Bind(EVENT_TABLE_CURRENT_INDEX_CHANGED, [this](wxCommandEvent& event) { updateStatus(); });
    table_->Bind(EVENT_TABLE_SELECTION_CHANGED,     [this](wxCommandEvent& event) { updateStatus(); });
    table_->Bind(EVENT_TABLE_ITEM_ACTIVATED, [this](wxCommandEvent& event)
    {
        wxMessageBox(replaceCpy(_("Row %x activated."), L"%x", numberTo<std::wstring>(event.GetInt())), L"FrostGrid", wxOK, this);
    });
    table_->Bind(EVENT_TABLE_COLUMN_CLICKED, [this](TableColumnClickEvent& event)
    {
        SetStatusText(replaceCpy(_("Column %x clicked."), L"%x", table_->getColumns().getColumn(event.col_).getEffectiveTitle()));
    });

    Bind(wxEVT_MENU, [this](wxCommandEvent& event) { onMenu(event); });
    Bind(wxEVT_CLOSE_WINDOW, [this](wxCloseEvent& event) { onClose(event); });

    updateStatus();
}


MainFrame::~MainFrame()
{
    table_->Destroy(); //detaches model_ without events: model_ is destroyed before the remaining child windows
}


void MainFrame::onClose(wxCloseEvent& event)
{
    try
    {
        table_->saveState(); //throw FileError
    }
    catch (const FileError& e) { logExtraError(e.toString()); }

    Destroy();
}


void MainFrame::onMenu(wxCommandEvent& event)
{
    ColumnRegistry& columns = table_->refColumns();
    try
    {
        switch (event.GetId())
        {
            case ID_TOGGLE_MULTI_SELECTION:
                table_->setMultiSelection(event.IsChecked());
                break;
            case ID_TOGGLE_CHECK_BOXES:
                table_->setCheckBoxes(event.IsChecked());
                break;
            case ID_TOGGLE_HEADER:
                table_->setHeaderHidden(event.IsChecked());
                break;
            case ID_TOGGLE_STRETCH:
                table_->setLastColumnStretched(event.IsChecked());
                break;
            case ID_TOGGLE_ALT_ROW_COLOR:
                table_->setAlternatingRowColor(event.IsChecked() ? std::optional<Color>(Color{242, 245, 250}) : std::nullopt);
                break;
            case ID_TOGGLE_FROZEN_NAME:
                columns.setFrozen(static_cast<size_t>(DemoColumn::name), event.IsChecked());
                break;
            case ID_TOGGLE_SIZE_COLUMN:
                columns.setVisible(static_cast<size_t>(DemoColumn::size), event.IsChecked());
                break;

            case ID_APPEND_ROWS:
                model_->appendRows(10);
                break;
            case ID_REMOVE_CURRENT:
                if (const int row = table_->getCurrentIndex();
                    row >= 0)
                    model_->removeRows(row, row);
                break;
            case ID_TOUCH_CURRENT:
                if (const int row = table_->getCurrentIndex();
                    row >= 0)
                    model_->touchRow(row); //self-sorting model: row is re-sorted
                break;

            default:
                return event.Skip();
        }
    }
    catch (const TableError& e) { wxMessageBox(e.toString(), _("Error"), wxOK | wxICON_ERROR, this); }

    updateStatus();
}


void MainFrame::updateStatus()
{
    std::wstring status = replaceCpy(_("Rows: %x"), L"%x", formatNumber(static_cast<int64_t>(table_->getModel() ? table_->getModel()->getRowCount() : 0)));

    if (const int row = table_->getCurrentIndex();
        row >= 0)
        status += L" | " + replaceCpy(_("Current: %x"), L"%x", numberTo<std::wstring>(row));

    if (table_->isMultiSelection())
        status += L" | " + replaceCpy(_("Selected: %x"), L"%x", numberTo<std::wstring>(table_->getSelectedIndexes().size()));

    SetStatusText(status);
}
