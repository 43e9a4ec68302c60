#include <jsondb/jsondb.h>

#include <iostream>

using namespace jsondb;

int main(int argc, char** argv) {
    auto path = (argc > 1)? argv[1]: "basic.json";

    // the file is created on first save if it does not exist
    auto db = jsondb::open(path);

    // count the number of times this program was run
    auto runs = db->get("runs");
    db->set("runs", runs.is_nil()? 1: runs.to_int() + 1);

    // mutation through a retrieved handle is tracked too
    db->get_or_insert("history", List{}).append(db->get("runs"));

    std::cout << db->to_json(2) << std::endl;

    // saved here, or else when db is destroyed
    db->save();
}
