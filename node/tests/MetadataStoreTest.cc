// ----------------------------------------------------------------------
// File: MetadataStoreTest.cc
// ----------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2026 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#include "node/MetadataStore.hh"
#include "node/io/FsAttrCodec.hh"
#include "node/tests/TestUtils.hh"
#include "gtest/gtest.h"
#include <cerrno>

using xmd::common::Status;
using xmd::node::MetadataStore;
using xmd::node::test::FakeAttrCodec;

TEST(MetadataStore, ReadStableValue)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "value";
  MetadataStore store(codec);
  std::string value;
  ASSERT_TRUE(store.ReadMetadata(0, "user.k", value));
  ASSERT_EQ(value, "value");
  ASSERT_EQ(codec.mProbes, 1);
  ASSERT_EQ(codec.mReads, 1);
}

TEST(MetadataStore, EmptyValueSkipsRead)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "";
  MetadataStore store(codec);
  std::string value = "junk";
  ASSERT_TRUE(store.ReadMetadata(0, "user.k", value));
  ASSERT_TRUE(value.empty());
  ASSERT_EQ(codec.mProbes, 1);
  ASSERT_EQ(codec.mReads, 0);
}

TEST(MetadataStore, GrowthBetweenProbeAndReadIsRetried)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "abcd";
  codec.mGrowOnRead = 2;
  codec.mGrowBy = 4;
  MetadataStore store(codec, 3);
  std::string value;
  Status st = store.ReadMetadata(0, "user.k", value);
  ASSERT_TRUE(st.ok()) << st.toString();
  ASSERT_EQ(value, "abcdgggggggg");
  ASSERT_EQ(codec.mReads, 3);
}

TEST(MetadataStore, ContinuousGrowthGivesUp)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "abcd";
  codec.mGrowOnRead = 1000;
  MetadataStore store(codec, 3);
  std::string value = "untouched";
  Status st = store.ReadMetadata(0, "user.k", value);
  ASSERT_TRUE(st.IsTooSmall());
  ASSERT_EQ(codec.mProbes, 3);
  ASSERT_EQ(codec.mReads, 3);
  ASSERT_EQ(value, "untouched");
}

TEST(MetadataStore, AttemptsAreConfigurable)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "abcd";
  codec.mGrowOnRead = 1000;
  MetadataStore store(codec, 7);
  std::string value;
  ASSERT_TRUE(store.ReadMetadata(0, "user.k", value).IsTooSmall());
  ASSERT_EQ(codec.mReads, 7);
  MetadataStore clamped(codec, 0);
  ASSERT_EQ(clamped.GetMaxAttempts(), 1);
}

TEST(MetadataStore, ShrinkReturnsShorterValue)
{
  FakeAttrCodec codec;
  codec.mAttrs["user.k"] = "12345678";
  codec.mShrinkOnRead = true;
  MetadataStore store(codec);
  std::string value;
  ASSERT_TRUE(store.ReadMetadata(0, "user.k", value));
  ASSERT_EQ(value, "1234");
}

TEST(MetadataStore, ErrorsPassThrough)
{
  FakeAttrCodec codec;
  MetadataStore store(codec);
  std::string value;
  ASSERT_TRUE(store.ReadMetadata(0, "user.none", value).IsNotFound());
  codec.mAttrs["user.k"] = "v";
  codec.mFailWith["user.k"] = EACCES;
  Status st = store.ReadMetadata(0, "user.k", value);
  ASSERT_TRUE(st.IsIOError());
  ASSERT_EQ(st.getErrc(), EACCES);
  st = store.WriteMetadata(0, "user.k", "x");
  ASSERT_TRUE(st.IsIOError());
  ASSERT_EQ(st.getErrc(), EACCES);
}

TEST(MetadataStore, ChunkKeys)
{
  ASSERT_EQ(MetadataStore::ChunkKey("user.md", 0), "user.md");
  ASSERT_EQ(MetadataStore::ChunkKey("user.md", 1), "user.md1");
  ASSERT_EQ(MetadataStore::ChunkKey("user.md", 12), "user.md12");
}

TEST(MetadataStore, ChunkedRoundTrip)
{
  FakeAttrCodec codec;
  MetadataStore store(codec, 3, 4);
  ASSERT_TRUE(store.WriteChunked(0, "user.md", "0123456789"));
  ASSERT_EQ(codec.mAttrs.size(), 3u);
  ASSERT_EQ(codec.mAttrs["user.md"], "0123");
  ASSERT_EQ(codec.mAttrs["user.md1"], "4567");
  ASSERT_EQ(codec.mAttrs["user.md2"], "89");
  std::string value;
  ASSERT_TRUE(store.ReadChunked(0, "user.md", value));
  ASSERT_EQ(value, "0123456789");
}

TEST(MetadataStore, ChunkedShorterValueDropsStaleChunks)
{
  FakeAttrCodec codec;
  MetadataStore store(codec, 3, 4);
  ASSERT_TRUE(store.WriteChunked(0, "user.md", std::string(17, 'a')));
  ASSERT_EQ(codec.mAttrs.size(), 5u);
  ASSERT_TRUE(store.WriteChunked(0, "user.md", "bbbbb"));
  ASSERT_EQ(codec.mAttrs.size(), 2u);
  std::string value;
  ASSERT_TRUE(store.ReadChunked(0, "user.md", value));
  ASSERT_EQ(value, "bbbbb");
}

TEST(MetadataStore, ChunkedEmptyValueKeepsOneChunk)
{
  FakeAttrCodec codec;
  MetadataStore store(codec, 3, 4);
  ASSERT_TRUE(store.WriteChunked(0, "user.md", ""));
  ASSERT_EQ(codec.mAttrs.size(), 1u);
  std::string value = "x";
  ASSERT_TRUE(store.ReadChunked(0, "user.md", value));
  ASSERT_TRUE(value.empty());
}

TEST(MetadataStore, ChunkedRemove)
{
  FakeAttrCodec codec;
  MetadataStore store(codec, 3, 4);
  std::string value;
  ASSERT_TRUE(store.ReadChunked(0, "user.md", value).IsNotFound());
  ASSERT_TRUE(store.RemoveChunked(0, "user.md").IsNotFound());
  ASSERT_TRUE(store.WriteChunked(0, "user.md", "0123456789"));
  codec.mAttrs["user.other"] = "keep";
  ASSERT_TRUE(store.RemoveChunked(0, "user.md"));
  ASSERT_EQ(codec.mAttrs.size(), 1u);
  ASSERT_EQ(codec.mAttrs.count("user.other"), 1u);
}

TEST(MetadataStore, RealAttributes)
{
  xmd::node::test::TmpPath tmp;
  ASSERT_GE(tmp.fd(), 0);
  XMD_SKIP_WITHOUT_XATTR(tmp);
  xmd::node::FsAttrCodec codec;
  MetadataStore store(codec);
  std::string big(1000, 'z');
  ASSERT_TRUE(store.WriteChunked(tmp.fd(), "user.xmd.md", big));
  std::string value;
  ASSERT_TRUE(store.ReadChunked(tmp.fd(), "user.xmd.md", value));
  ASSERT_EQ(value, big);
  ASSERT_TRUE(store.ReadMetadata(tmp.fd(), "user.xmd.md", value));
  ASSERT_EQ(value, std::string(store.GetChunkSize(), 'z'));
  ASSERT_TRUE(store.RemoveChunked(tmp.fd(), "user.xmd.md"));
  ASSERT_TRUE(store.ReadChunked(tmp.fd(), "user.xmd.md", value).IsNotFound());
}
