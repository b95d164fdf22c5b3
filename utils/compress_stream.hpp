// -*- mode: c++ -*-
//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __UTILS__COMPRESS_STREAM__HPP__
#define __UTILS__COMPRESS_STREAM__HPP__ 1

// file streams with transparent gzip/bzip2 (de)compression by extension. "-" is stdin/stdout.

#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>

#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/bzip2.hpp>

namespace utils
{
  namespace impl
  {
    inline
    bool is_gzip(const boost::filesystem::path& path)
    {
      return path.extension() == ".gz";
    }

    inline
    bool is_bzip2(const boost::filesystem::path& path)
    {
      return path.extension() == ".bz2";
    }
  };

  class compress_istream : public boost::iostreams::filtering_istream
  {
  public:
    typedef boost::filesystem::path path_type;

    compress_istream(const path_type& path, const size_t buffer_size = 4096)
    {
      open(path, buffer_size);
    }

    void open(const path_type& path, const size_t buffer_size = 4096)
    {
      namespace io = boost::iostreams;

      reset();

      if (path == "-") {
	push(std::cin, buffer_size);
	return;
      }

      if (! boost::filesystem::exists(path))
	throw std::runtime_error("no file: " + path.string());

      if (impl::is_gzip(path))
	push(io::gzip_decompressor());
      else if (impl::is_bzip2(path))
	push(io::bzip2_decompressor());

      push(io::file_source(path.string(), std::ios_base::in | std::ios_base::binary), buffer_size);
    }
  };

  class compress_ostream : public boost::iostreams::filtering_ostream
  {
  public:
    typedef boost::filesystem::path path_type;

    compress_ostream(const path_type& path, const size_t buffer_size = 4096)
    {
      open(path, buffer_size);
    }

    void open(const path_type& path, const size_t buffer_size = 4096)
    {
      namespace io = boost::iostreams;

      reset();

      if (path == "-") {
	push(std::cout, buffer_size);
	return;
      }

      if (impl::is_gzip(path))
	push(io::gzip_compressor());
      else if (impl::is_bzip2(path))
	push(io::bzip2_compressor());

      push(io::file_sink(path.string(), std::ios_base::out | std::ios_base::trunc | std::ios_base::binary), buffer_size);
    }
  };
};

#endif
