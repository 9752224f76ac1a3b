/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Stevedore project.
 */

#pragma once

/**
 * @file StevedoreCore.h
 * @brief Single header that includes all Stevedore core components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Memory
#include "Memory/Block.h"
#include "Memory/BlockPool.h"
#include "Memory/IBlockPool.h"
#include "Memory/PseudoBlockPool.h"

// Concurrency
#include "Concurrency/BoundedQueue.h"

// Backends
#include "VirtualFileSystem/FileOperationHandle.h"
#include "VirtualFileSystem/FileStream.h"
#include "VirtualFileSystem/FileSystemException.h"
#include "VirtualFileSystem/IFileSystemBackend.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"
#include "VirtualFileSystem/MemoryFileSystemBackend.h"

// Operations
#include "Operations/Batch.h"
#include "Operations/CopyFile.h"
#include "Operations/CopyTree.h"
#include "Operations/CreateDirectory.h"
#include "Operations/Delete.h"
#include "Operations/DeleteTree.h"
#include "Operations/IOperationObserver.h"
#include "Operations/Move.h"
#include "Operations/Operation.h"
#include "Operations/OperationErrors.h"
#include "Operations/OperationEvent.h"
#include "Operations/OperationPolicy.h"
#include "Operations/OperationSession.h"
#include "Operations/OperationState.h"
#include "Operations/TransferTree.h"
