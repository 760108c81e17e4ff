#pragma once

#include "redisconncommands.hpp"
#include "redisconnconfig.hpp"
#include "redisconnconnection.hpp"
#include "redisconnconverters.hpp"
#include "redisconndriver.hpp"
#include "redisconnerrors.hpp"
#include "redisconnhashmapper.hpp"
#include "redisconnlog.hpp"
#include "redisconnreactive.hpp"
#include "redisconnreply.hpp"
#include "redisconnserializer.hpp"
#include "redisconnstream.hpp"
#include "redisconnstring.hpp"
#include "redisconnsubscription.hpp"
#include "redisconntypes.hpp"
