
//    --------------------------------------------------------------------
//
//    This file is part of eprune.
//
//    eprune is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    eprune is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with eprune. If not, see <http://www.gnu.org/licenses/>.
//
//    --------------------------------------------------------------------

#ifndef __EPRUNE_H__
#define __EPRUNE_H__

#include "defs/defs.h"
#include "param.h"
#include "pipeline.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "helper/errors.h"
#include "helper/zfile.h"

#include "intervals/intervals.h"

#include "annot/event.h"
#include "annot/relocate.h"
#include "annot/protocols.h"

#include "artifacts/artifacts.h"

#include "timeline/timeline.h"
#include "timeline/hypno.h"

#include "edf/excise.h"
#include "edf/recording.h"

#include "db/sqlwrap.h"
#include "db/db.h"
#include "db/report.h"

#endif
