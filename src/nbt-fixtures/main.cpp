/***************************************************************************\
* Name        : nbt-fixtures                                                *
* Description : dumps the NBT sample values of every tag kind               *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#include <nbt/fixtures.hpp>
#include <nbt/nbt.hpp>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace
{
using namespace std::literals;
namespace fs = std::filesystem;

constexpr auto opt_version = "--version"sv;
constexpr auto opt_v       = "-v"sv;

constexpr auto opt_help = "--help"sv;
constexpr auto opt_h    = "-h"sv;

constexpr auto opt_kind_prefix = "--kind="sv;
constexpr auto opt_out_prefix  = "--out="sv;

void print_usage( )
{
    std::cout << "Usage: nbt-fixtures [OPTION]...\n"
              << "Print the NBT sample values of every tag kind.\n"
              << "  --kind=NAME     Only samples of kind NAME (byte, short, int, long, float, double,\n"
              << "                  byte_array, string, list, compound, int_array, long_array).\n"
              << "                  May be specified multiple times.\n"
              << "  --out=OUT_DIR   Write every sample as OUT_DIR/<kind>-<index>.nbt.\n"
              << "  -v, --version   Show version info and exit.\n"
              << "  -h, --help      Show this text and exit.\n\n";
}

auto load_file( const fs::path & file_path ) -> std::string
{
    const auto file_size = fs::file_size( file_path );
    auto file_content    = std::string( file_size, '\0' );

    if( auto * p_file = fopen( file_path.string( ).c_str( ), "rb" ); p_file )
    {
        const auto read = fread( file_content.data( ), 1, file_content.size( ), p_file );
        fclose( p_file );
        file_content.resize( read );
        return file_content;
    }
    perror( file_path.string( ).c_str( ) );
    throw std::system_error( std::make_error_code( std::errc( errno ) ) );
}

void save_file( const fs::path & file_path, std::string_view file_content )
{
    if( auto * p_file = fopen( file_path.string( ).c_str( ), "wb" ); p_file )
    {
        const auto written = fwrite( file_content.data( ), 1, file_content.size( ), p_file );
        fclose( p_file );
        if( written == file_content.size( ) )
        {
            return;
        }
    }
    perror( file_path.string( ).c_str( ) );
    throw std::system_error( std::make_error_code( std::errc( errno ) ) );
}

//- writes the sample as a named root tag and checks the file decodes to the same value
void dump_sample( const fs::path & output_dir, nbt::tag_kind kind, size_t index,
                  const nbt::value & sample )
{
    const auto name      = nbt::tag_kind_name( kind );
    const auto file_path = output_dir / ( std::string( name ) + "-" + std::to_string( index ) + ".nbt" );

    save_file( file_path, nbt::bin::serialize_named( name, sample ) );

    const auto loaded = nbt::bin::deserialize_named( load_file( file_path ) );
    if( loaded.name != name || loaded.data != sample )
    {
        throw std::runtime_error( "sample mismatch in " + file_path.string( ) );
    }
}

void dump_kind( const nbt::fixtures::registry & generators, nbt::tag_kind kind,
                const fs::path & output_dir )
{
    const auto encode = nbt::bin::encoder_for( kind );
    auto samples      = generators.lookup( kind )( );
    auto total_size   = size_t( 0 );

    for( size_t i = 0; i < samples.size( ); i++ )
    {
        total_size += encode( samples[ i ] ).size( );
        if( !output_dir.empty( ) )
        {
            dump_sample( output_dir, kind, i, samples[ i ] );
        }
    }

    std::cout << nbt::tag_kind_name( kind ) << " id=" << int( nbt::tag_kind_index( kind ) )
              << " samples=" << samples.size( ) << " bytes=" << total_size << "\n";
}

auto select_generators( const std::vector< nbt::tag_kind > & kinds ) -> nbt::fixtures::registry
{
    if( kinds.empty( ) )
    {
        return nbt::fixtures::registry::standard( );
    }

    const auto & standard = nbt::fixtures::registry::standard( );
    auto entries          = std::vector< nbt::fixtures::registry::entry >( );
    for( auto kind : kinds )
    {
        entries.emplace_back( kind, standard.lookup( kind ) );
    }
    return nbt::fixtures::registry( std::span< const nbt::fixtures::registry::entry >( entries ) );
}

}// namespace

auto main( int argc, char * argv[] ) -> int
{
    auto output_dir = fs::path( );
    auto kinds      = std::vector< nbt::tag_kind >( );

    for( ; argc > 1 && argv[ 1 ][ 0 ] == '-'; argc--, argv++ )
    {
        const auto opt = std::string_view( argv[ 1 ] );

        if( opt_help == opt || opt_h == opt )
        {
            print_usage( );
            return 0;
        }

        if( opt_version == opt || opt_v == opt )
        {
            std::cout << "nbt-fixtures version 0.1.0\n";
            return 0;
        }

        if( opt.starts_with( opt_kind_prefix ) )
        {
            const auto name = opt.substr( opt_kind_prefix.size( ) );
            const auto kind = nbt::tag_kind_from_name( name );
            if( !kind || *kind == nbt::tag_kind::end )
            {
                std::cerr << "Unknown tag kind: " << name << ", use -h or --help\n";
                return 1;
            }
            for( auto selected : kinds )
            {
                if( selected == *kind )
                {
                    std::cerr << "Duplicate tag kind: " << name << "\n";
                    return 1;
                }
            }
            kinds.push_back( *kind );
        }
        else if( opt.starts_with( opt_out_prefix ) )
        {
            output_dir = fs::absolute( opt.substr( opt_out_prefix.size( ) ) );
        }
        else
        {
            std::cerr << "Unknown option: " << opt << ", use -h or --help\n";
            return 1;
        }
    }

    if( argc > 1 )
    {
        std::cerr << "Unexpected argument: " << argv[ 1 ] << ", use -h or --help\n";
        return 1;
    }

    try
    {
        if( !output_dir.empty( ) )
        {
            fs::create_directories( output_dir );
        }

        const auto generators = select_generators( kinds );
        for( auto kind : generators.kinds( ) )
        {
            dump_kind( generators, kind, output_dir );
        }
    }
    catch( const std::exception & e )
    {
        std::cerr << e.what( ) << '\n';
        return 1;
    }

    return 0;
}
