#pragma once

#include "infragraph/v1/application.pb.h"
#include "infragraph/v1/change_set.pb.h"
#include "infragraph/v1/graph.pb.h"
