// Prints the history of a document stored in a revision database.
// Exit status: 0 on success, 1 if the document or its history does not exist, 2 if the request requires
// authentication, 3 if the document path is invalid, 4 if the database cannot be opened or read.
#include <iostream>
#include "rhbase/args_parser.h"
#include "revhist/util/init_store.h"
#include "history_page_lib.h"

int main(int argc, char** argv) {
  revhist::StoreFlags storeFlags;
  history_page::HistoryRequest request;
  rhbase::parseArgs(argc, argv, &storeFlags, "--locale", &request.locale, "--limit", &request.limit, "--page",
                    &request.page, "--authenticated", &request.authenticated, "path", &request.documentPath);
  return history_page::printHistoryPageFromDatabase(storeFlags, request, std::cout);
}
