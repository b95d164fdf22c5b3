//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// replace rare terminals by <unk>. Two passes: the whole treebank is counted before any replacement.

#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/treebank.hpp>
#include <treenorm/unknown.hpp>

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

typedef treenorm::Tree      tree_type;
typedef treenorm::Frequency frequency_type;

typedef std::vector<tree_type, std::allocator<tree_type> > tree_set_type;

path_type input_file = "-";
path_type output_file = "-";

int cutoff = 2;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (cutoff <= 0)
      throw std::runtime_error("cutoff must be positive");

    tree_set_type  trees;
    frequency_type frequency;

    {
      utils::compress_istream is(input_file, 1024 * 1024);

      treenorm::Treebank treebank(is);

      tree_type tree;

      while (treebank.read(tree)) {
	if (treebank.failed())
	  std::cerr << treebank.error() << std::endl;

	frequency.collect(tree);

	trees.push_back(tree_type());
	trees.back().swap(tree);
      }
    }

    if (debug)
      std::cerr << "trees: " << trees.size() << " vocabulary: " << frequency.size() << std::endl;

    const treenorm::MaskUnknown mask(frequency, cutoff);

    utils::compress_ostream os(output_file, 1024 * 1024);

    tree_type masked;
    size_t replaced = 0;

    tree_set_type::const_iterator titer_end = trees.end();
    for (tree_set_type::const_iterator titer = trees.begin(); titer != titer_end; ++ titer) {
      mask(*titer, masked);

      if (debug >= 2 && masked != *titer)
	++ replaced;

      os << masked << '\n';
    }

    if (debug >= 2)
      std::cerr << "trees with <unk>: " << replaced << std::endl;
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

    ("cutoff",    po::value<int>(&cutoff)->default_value(cutoff), "words observed less than cutoff are replaced by <unk>")

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
