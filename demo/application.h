// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef APPLICATION_H_6390218845120376641
#define APPLICATION_H_6390218845120376641

#include <wx/app.h>


namespace frost_demo
{
class Application : public wxApp
{
private:
    bool OnInit() override;
};
}

#endif //APPLICATION_H_6390218845120376641
