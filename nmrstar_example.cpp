#include "include/nmrstar.hpp"
#include <iostream>
#include <iomanip>

// Example NMR-STAR entry
const char* example_entry = R"(data_15000

save_entry_information
   _Entry.Sf_category      entry_information
   _Entry.Sf_framecode     entry_information
   _Entry.ID               15000
   _Entry.Title
;
Solution structure of a small example protein
;
   _Entry.Submission_date  2019-06-01

   loop_
      _Entry_author.Ordinal
      _Entry_author.Given_name
      _Entry_author.Family_name

      1  Jane   Smith
      2  'Li'   "O'Brien"
   stop_
save_

save_assigned_chem_shifts
   _Assigned_chem_shift_list.Sf_category  assigned_chemical_shifts
   _Assigned_chem_shift_list.Sf_framecode assigned_chem_shifts
   _Assigned_chem_shift_list.Entry_ID     15000
   _Assigned_chem_shift_list.Details      $entry_information

   loop_
      _Atom_chem_shift.ID
      _Atom_chem_shift.Comp_ID
      _Atom_chem_shift.Atom_ID
      _Atom_chem_shift.Val
      _Atom_chem_shift.Val_err

      1  MET  H   8.25   0.02
      2  MET  N   120.1  .
      3  GLY  H   7.90   ?
      4  GLY  CA  45.3   0.1
   stop_
save_
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

template <typename Ctx>
bool report(Ctx const & ctx)
{
    for (auto const & w : ctx.warnings)
        std::cout << "  warning (line " << w.loc.line << "): " << w.message << "\n";

    if (!ctx.has_errors())
        return true;

    std::cout << "✗ Failed with errors:\n";
    for (auto const & err : ctx.errors)
        std::cout << "  line " << err.loc.line << ": " << err.message << "\n";
    return false;
}

void show_parsing()
{
    print_separator("1: Parsing");

    auto ctx = nmrstar::load(example_entry);
    if (!report(ctx))
        return;

    nmrstar::entry const & e = ctx.result;
    std::cout << "✓ Parsed entry " << e.entry_id() << " with " << e.size() << " saveframes\n";

    for (auto const & sf : e.saveframes())
    {
        std::cout << "  • " << sf.name() << " (" << sf.category().value_or("no category") << "): "
                  << sf.tags().size() << " tags, "
                  << sf.loops().size() << " loops\n";
    }
}

void show_loop_access()
{
    print_separator("2: Loop Access");

    auto ctx = nmrstar::load(example_entry);
    if (!report(ctx))
        return;

    auto const * shifts = ctx.result.get_saveframe_by_name("assigned_chem_shifts");
    auto const * l = shifts ? shifts->get_loop("Atom_chem_shift") : nullptr;
    if (!l)
    {
        std::cout << "✗ No chemical shift loop\n";
        return;
    }

    nmrstar::loop_view view(*l);

    for (auto const & t : l->tags())
        std::cout << std::left << std::setw(10) << t;
    std::cout << "\n" << std::string(50, '-') << "\n";

    for (auto r : view)
    {
        for (size_t i = 0; i < r.raw().size(); ++i)
            std::cout << std::left << std::setw(10) << r[i];
        std::cout << "\n";
    }

    std::cout << "\nProton shifts:\n";
    for (auto r : view.where("Atom_ID", "H"))
    {
        auto err = r.get_float("Val_err");
        std::cout << "  " << *r.get("Comp_ID") << " " << r.get_float("Val").value_or(0.0)
                  << " +/- " << (err ? std::to_string(*err) : std::string("n/a")) << "\n";
    }

    std::cout << "\nAs CSV:\n" << l->get_data_as_csv();
}

void show_tag_queries()
{
    print_separator("3: Tag Queries");

    auto ctx = nmrstar::load(example_entry);
    if (!report(ctx))
        return;

    auto const & e = ctx.result;

    for (auto const & v : e.get_tag("_Entry.Title"))
        std::cout << "Title: " << v << "\n";

    auto families = e.get_tag("_Entry_author.Family_name");
    std::cout << "Authors: ";
    for (size_t i = 0; i < families.size(); ++i)
    {
        std::cout << families[i];
        if (i < families.size() - 1) std::cout << ", ";
    }
    std::cout << "\n";

    for (auto const * sf : e.get_saveframes_by_category("assigned_chemical_shifts"))
        std::cout << "Shift list: " << sf->name() << "\n";
}

void show_editing()
{
    print_separator("4: Editing");

    auto ctx = nmrstar::load(example_entry);
    if (!report(ctx))
        return;

    auto & e = ctx.result;
    nmrstar::editor ed(e);

    if (auto s = ed.rename_saveframe("entry_information", "entry_info"); !s)
        std::cout << "✗ " << s.message() << "\n";
    else
        std::cout << "✓ Renamed; reference now "
                  << e.get_saveframe_by_name("assigned_chem_shifts")->tag_value("Details").value_or("?") << "\n";

    if (auto s = ed.set_entry_id("16000"); !s)
        std::cout << "✗ " << s.message() << "\n";
    else
        std::cout << "✓ Entry id " << e.entry_id() << "\n";

    auto * authors = e.get_saveframe_by_name("entry_info")->get_loop("Entry_author");
    if (auto s = authors->add_row({ "3", "Ana", "Silva" }); !s)
        std::cout << "✗ " << s.message() << "\n";

    if (auto s = authors->add_row({ "4", "Too few" }); !s)
        std::cout << "✓ Short row refused: " << s.message() << "\n";

    std::cout << "\n" << nmrstar::format(*authors).result;
}

void show_writing()
{
    print_separator("5: Writing");

    auto ctx = nmrstar::load(example_entry);
    if (!report(ctx))
        return;

    auto text = nmrstar::format(ctx.result);
    if (!report(text))
        return;
    std::cout << text.result;

    auto again = nmrstar::load(text.result);
    std::cout << "\n" << (again.result == ctx.result ? "✓" : "✗") << " Re-reading gives the same entry\n";

    std::cout << "\nJSON:\n" << nmrstar::to_json(*ctx.result.get_saveframe_by_name("entry_information"),
                                                 nmrstar::json_options{ true }) << "\n";
}

void show_errors()
{
    print_separator("6: Error Reporting");

    auto ctx = nmrstar::load("data_bad\nsave_a\n   _A.X 'unterminated\nsave_\n");
    report(ctx);

    nmrstar::parse_options strict;
    strict.strict = true;
    auto mismatch = nmrstar::load("data_x\nsave_a\n   _A.X 1\nsave_b\n", strict);
    report(mismatch);
}

int main()
{
    show_parsing();
    show_loop_access();
    show_tag_queries();
    show_editing();
    show_writing();
    show_errors();
    return 0;
}
