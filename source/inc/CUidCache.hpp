/**
 * @file CUidCache.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief 
 * @version 0.1
 * @date 2025-12-04
 * 
 * 
 */
#ifndef LAP_UIDCACHE_UIDCACHE_HPP
#define LAP_UIDCACHE_UIDCACHE_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// uidcache common
#include "CDataType.hpp"
#include "CUidErrorDomain.hpp"

// cache contract and stores
#include "IUuidCache.hpp"
#include "CUuidSqliteCache.hpp"
#include "CUuidMemoryCache.hpp"

#include "CUidCacheManager.hpp"

#endif
