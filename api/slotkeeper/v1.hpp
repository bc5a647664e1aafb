#pragma once

#include "slotkeeper/v1/types.pb.h"
#include "slotkeeper/v1/conversation.pb.h"
#include "slotkeeper/v1/booking.pb.h"
