#pragma once

#include "sampledir/v1/dir_meta.pb.h"
#include "sampledir/v1/permissions.pb.h"
