// util.cpp
// Copyright (c) 2021, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <stdio.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/stat.h>

#include "util.h"

namespace util
{
	snip::StrErrorOr<zst::unique_span<uint8_t[]>> readEntireFile(const std::string& path)
	{
		auto fd = open(path.c_str(), O_RDONLY);
		if(fd < 0)
			return zst::ErrFmt("failed to open '{}'; open(): {}", path, strerror(errno));

		auto _ = Defer([&fd]() { close(fd); });

		struct stat st;
		if(fstat(fd, &st) < 0)
			return zst::ErrFmt("failed to stat '{}'; fstat(): {}", path, strerror(errno));

		if(not S_ISREG(st.st_mode))
			return zst::ErrFmt("'{}' is not a regular file", path);

		// mmap refuses zero-length mappings
		auto size = static_cast<size_t>(st.st_size);
		if(size == 0)
			return zst::Ok(zst::unique_span<uint8_t[]>());

		auto ptr = mmap(0, size, PROT_READ, MAP_PRIVATE, fd, /* offset: */ 0);
		if(ptr == reinterpret_cast<void*>(-1))
			return zst::ErrFmt("failed to read '{}': mmap(): {}", path, strerror(errno));

		return zst::Ok(zst::unique_span<uint8_t[]>((uint8_t*) ptr, size, [](const void* p, size_t n) {
			munmap(const_cast<void*>(p), n);
		}));
	}
}
