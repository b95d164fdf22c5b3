//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// restore binarized (parser output) trees to the original form

#include <cstdlib>
#include <stdexcept>
#include <iostream>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/treebank.hpp>
#include <treenorm/debinarize.hpp>

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

path_type input_file = "-";
path_type output_file = "-";

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    const bool flush_output = (output_file == "-"
			       || (boost::filesystem::exists(output_file)
				   && ! boost::filesystem::is_regular_file(output_file)));

    utils::compress_istream is(input_file, 1024 * 1024);
    utils::compress_ostream os(output_file, 1024 * 1024);

    treenorm::Treebank   treebank(is);
    treenorm::Debinarize debinarizer;

    treenorm::Tree tree;
    treenorm::Tree debinarized;

    size_t failed = 0;

    while (treebank.read(tree)) {
      debinarized.clear();

      if (treebank.failed()) {
	std::cerr << treebank.error() << std::endl;
	++ failed;
      } else {
	try {
	  debinarizer(tree, debinarized);
	}
	catch (const treenorm::StructuralInvariantError& err) {
	  std::cerr << "line " << treebank.line() << ": " << err.what() << std::endl;
	  debinarized.clear();
	  ++ failed;
	}
      }

      os << debinarized;

      if (flush_output)
	os << std::endl;
      else
	os << '\n';
    }

    if (debug)
      std::cerr << "lines: " << treebank.line() << " failed: " << failed << std::endl;
  } catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return 1;
  }
  return 0;
}


void options(int argc, char** argv)
{
  namespace po = boost::program_options;

  po::options_description desc("options");
  desc.add_options()
    ("input",     po::value<path_type>(&input_file)->default_value(input_file),   "input file")
    ("output",    po::value<path_type>(&output_file)->default_value(output_file), "output")

    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")

    ("help", "help message");

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), vm);
  po::notify(vm);

  if (vm.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc << '\n';
    exit(0);
  }
}
