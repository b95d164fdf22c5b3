//
//  Copyright(C) 2014 Taro Watanabe <taro.watanabe@nict.go.jp>
//

// transform and normalize treebank...

#include <cstdlib>
#include <stdexcept>
#include <iostream>
#include <vector>
#include <iterator>
#include <algorithm>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <treenorm/tree.hpp>
#include <treenorm/treebank.hpp>

#include "utils/compress_stream.hpp"

typedef boost::filesystem::path path_type;

typedef treenorm::Symbol symbol_type;
typedef treenorm::Tree   tree_type;

typedef std::vector<symbol_type, std::allocator<symbol_type> > sentence_type;

path_type input_file = "-";
path_type output_file = "-";

std::string root_symbol;
std::string top_label = "TOP";
bool remove_none = false;

bool leaf_mode = false;
bool treebank_mode = false;

bool validate = false;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);

    if (int(leaf_mode) + treebank_mode > 1)
      throw std::runtime_error("multiple output options specified: leaf/treebank(default: treebank)");
    if (int(leaf_mode) + treebank_mode == 0)
      treebank_mode = true;

    const symbol_type top = symbol_type::non_terminal(top_label);

    const bool flush_output = (output_file == "-"
			       || (boost::filesystem::exists(output_file)
				   && ! boost::filesystem::is_regular_file(output_file)));

    utils::compress_istream is(input_file, 1024 * 1024);
    utils::compress_ostream os(output_file, 1024 * 1024);

    treenorm::Treebank treebank(is);

    tree_type     tree;
    sentence_type sent;

    size_t failed = 0;

    while (treebank.read(tree)) {
      if (treebank.failed()) {
	std::cerr << treebank.error() << std::endl;
	++ failed;
      }

      if (! tree.empty() && ! root_symbol.empty())
	tree.label_ = symbol_type::non_terminal(root_symbol);

      if (remove_none)
	treenorm::remove_none(tree);

      if (validate)
	try {
	  treenorm::validate(tree, top);
	}
	catch (const treenorm::StructuralInvariantError& err) {
	  std::cerr << "line " << treebank.line() << ": " << err.what() << std::endl;
	  tree.clear();
	  ++ failed;
	}

      if (leaf_mode) {
	sent.clear();

	tree.leaves(std::back_inserter(sent));

	if (! sent.empty()) {
	  std::copy(sent.begin(), sent.end() - 1, std::ostream_iterator<symbol_type>(os, " "));
	  os << sent.back();
	}
      } else if (treebank_mode)
	os << tree;

      os << '\n';
      if (flush_output)
	os << std::flush;
    }

    if (debug)
      std::cerr << "lines: " << treebank.line() << " failed: " << failed << std::endl;
  }
  catch (const std::exception& err) {
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

    ("replace-root",   po::value<std::string>(&root_symbol), "replace root symbol")
    ("remove-none",    po::bool_switch(&remove_none),        "remove -NONE-")

    ("top",       po::value<std::string>(&top_label)->default_value(top_label), "top label checked by --validate")

    ("leaf",      po::bool_switch(&leaf_mode),     "output leaf nodes")
    ("treebank",  po::bool_switch(&treebank_mode), "output treebank")

    ("validate", po::bool_switch(&validate), "validate treebank")

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
